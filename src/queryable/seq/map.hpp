// Copyright 2021 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_MAP_HPP
#define QUERYABLE_SEQ_MAP_HPP

#include <queryable/config.hpp>
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/invoke.hpp>
#include <queryable/seq/requirements.hpp>

#include <queryable/utility.hpp>

#include <type_traits>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// map
//
template <typename Seq, typename MapFn>
class Map
{
   public:
    using Item = std::decay_t<CallbackResult<MapFn, SeqItem<Seq>, Seq>>;

    static_assert(!std::is_void_v<Item>, "Mapped functions must return a value");

    explicit Map(Seq&& seq, MapFn&& map_fn) noexcept : seq_(QRY_FORWARD(seq)), map_fn_(QRY_FORWARD(map_fn))
    {
    }

    Optional<Item> next()
    {
        auto item = seq_.next();
        if (!item) {
            return None;
        }
        return Item(invoke_callback("map", map_fn_, *item, index_++, seq_));
    }

   private:
    Seq seq_;
    MapFn map_fn_;
    usize index_ = 0;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_MAP_HPP

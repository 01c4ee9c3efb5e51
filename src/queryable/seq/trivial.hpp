//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_TRIVIAL_HPP
#define QUERYABLE_SEQ_TRIVIAL_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>
#include <queryable/utility.hpp>

#include <type_traits>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// Empty<T>: yields nothing.
//
template <typename T>
struct Empty {
    using Item = T;

    Optional<T> next() const
    {
        return None;
    }
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// SingleItem<T>: yields its one item, then None.
//
template <typename T>
class SingleItem
{
   public:
    using Item = T;

    explicit SingleItem(T&& item) noexcept : pending_{std::move(item)}
    {
    }

    Optional<T> next()
    {
        Optional<T> out;
        out.swap(this->pending_);
        return out;
    }

   private:
    Optional<T> pending_;
};

template <typename T>
inline auto single_item(T&& item)
{
    using Item = std::decay_t<T>;

    return SingleItem<Item>{Item(QRY_FORWARD(item))};
}

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_TRIVIAL_HPP

// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_FLATTEN_HPP
#define QUERYABLE_SEQ_FLATTEN_HPP

#include <queryable/config.hpp>
//
#include <queryable/from.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <type_traits>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// flatten - turns Seq<Range<T>> into Seq<T> by concatenating; one level only.
//
//  Each outer item is converted to a sequence with `qry::from` when it is reached, so an inner
//  sequence is never pulled before the previous one is exhausted.
//
template <typename OuterSeq>
class Flatten
{
   public:
    using InnerSeq = decltype(::qry::from(std::declval<SeqItem<OuterSeq>>()));
    using Item = SeqItem<InnerSeq>;

    explicit Flatten(OuterSeq&& outer) noexcept : outer_(QRY_FORWARD(outer))
    {
    }

    Optional<Item> next()
    {
        for (;;) {
            if (inner_) {
                auto item = inner_->next();
                if (item) {
                    return item;
                }
                inner_ = None;
            }
            auto next_inner = outer_.next();
            if (!next_inner) {
                return None;
            }
            inner_.emplace(::qry::from(std::move(*next_inner)));
        }
    }

   private:
    OuterSeq outer_;
    Optional<InnerSeq> inner_;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_FLATTEN_HPP

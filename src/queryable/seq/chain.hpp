//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_CHAIN_HPP
#define QUERYABLE_SEQ_CHAIN_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <type_traits>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// Chain<Head, Tail>
//
//  Every item of `head`, then every item of `tail`.  The head is destroyed as soon as it runs out.
//
template <typename Head, typename Tail>
class Chain
{
   public:
    using Item = std::common_type_t<SeqItem<Head>, SeqItem<Tail>>;

    explicit Chain(Head&& head, Tail&& tail) noexcept : head_{QRY_FORWARD(head)}, tail_(QRY_FORWARD(tail))
    {
    }

    Optional<Item> next()
    {
        if (this->head_) {
            if (auto item = this->head_->next()) {
                return Item(std::move(*item));
            }
            this->head_.reset();
        }
        return this->pull_tail();
    }

   private:
    Optional<Item> pull_tail()
    {
        auto item = this->tail_.next();
        if (!item) {
            return None;
        }
        return Item(std::move(*item));
    }

    Optional<Head> head_;
    Tail tail_;
};

template <typename Head, typename Tail>
[[nodiscard]] inline auto chain(Head&& head, Tail&& tail)
{
    static_assert(!std::is_reference_v<Head> && !std::is_reference_v<Tail>,
                  "chain takes ownership of both sequences; use qry::from to borrow an lvalue");

    return Chain<Head, Tail>{QRY_FORWARD(head), QRY_FORWARD(tail)};
}

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_CHAIN_HPP

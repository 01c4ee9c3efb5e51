//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_DROP_LAST_HPP
#define QUERYABLE_SEQ_DROP_LAST_HPP

#include <queryable/config.hpp>
//
#include <queryable/assert.hpp>
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <deque>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// drop_last(n) - every item except the last `n`.
//
//  Emission is delayed by `n` positions through a FIFO window: the first pull fills the window,
//  then each newly pulled item pushes out the oldest one.  When the upstream ends, the window holds
//  exactly the last `n` items, which are discarded.  An upstream with fewer than `n` items emits
//  nothing.
//
template <typename Seq>
class DropLast
{
   public:
    using Item = SeqItem<Seq>;

    explicit DropLast(Seq&& seq, usize n) noexcept : seq_(QRY_FORWARD(seq)), n_{n}
    {
    }

    Optional<Item> next()
    {
        if (done_) {
            return None;
        }
        while (window_.size() < n_) {
            Optional<Item> item = seq_.next();
            if (!item) {
                return this->finish();
            }
            window_.emplace_back(std::move(*item));
        }

        Optional<Item> item = seq_.next();
        if (!item) {
            return this->finish();
        }
        if (n_ == 0) {
            return item;
        }
        window_.emplace_back(std::move(*item));

        Item oldest = std::move(window_.front());
        window_.pop_front();

        QRY_ASSERT_EQ(window_.size(), n_);

        return oldest;
    }

   private:
    Optional<Item> finish()
    {
        done_ = true;
        window_.clear();
        return None;
    }

    Seq seq_;
    usize n_;
    std::deque<Item> window_;
    bool done_ = false;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_DROP_LAST_HPP

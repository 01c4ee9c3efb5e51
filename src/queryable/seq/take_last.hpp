//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_TAKE_LAST_HPP
#define QUERYABLE_SEQ_TAKE_LAST_HPP

#include <queryable/config.hpp>
//
#include <queryable/int_types.hpp>
#include <queryable/logging.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <deque>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// take_last(n, stop_index) - only the last `n` items.
//
//  The first pull drains the upstream through a window of at most `n` items while counting the
//  total, so the absolute position of each retained item is known.  If `stop_index` is set, items
//  at or past that absolute position are not emitted.
//
template <typename Seq>
class TakeLast
{
   public:
    using Item = SeqItem<Seq>;

    explicit TakeLast(Seq&& seq, usize n, Optional<usize> stop_index) noexcept
        : seq_(QRY_FORWARD(seq))
        , n_{n}
        , stop_index_{stop_index}
    {
    }

    Optional<Item> next()
    {
        if (!filled_) {
            this->fill();
        }
        if (window_.empty()) {
            return None;
        }
        if (stop_index_ && position_ >= *stop_index_) {
            window_.clear();
            return None;
        }
        Item item = std::move(window_.front());
        window_.pop_front();
        ++position_;
        return item;
    }

   private:
    void fill()
    {
        usize count = 0;
        for (;;) {
            Optional<Item> item = seq_.next();
            if (!item) {
                break;
            }
            ++count;
            window_.emplace_back(std::move(*item));
            if (window_.size() > n_) {
                window_.pop_front();
            }
        }
        filled_ = true;
        position_ = count - window_.size();

        QRY_VLOG(2) << "take_last: kept " << window_.size() << " of " << count << " items";
    }

    Seq seq_;
    usize n_;
    Optional<usize> stop_index_;
    std::deque<Item> window_;
    usize position_ = 0;
    bool filled_ = false;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_TAKE_LAST_HPP

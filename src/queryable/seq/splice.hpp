//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//

#pragma once
#ifndef QUERYABLE_SEQ_SPLICE_HPP
#define QUERYABLE_SEQ_SPLICE_HPP

#include <queryable/config.hpp>
//

#include <queryable/assert.hpp>
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <deque>
#include <utility>
#include <vector>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// splice(start, delete_count, inserted)
//
//  A single cursor over `seq` moves through three phases:
//
//   1. kHead: emit the items before `start`.
//   2. kInsert: emit `inserted`.
//   3. kTail: discard `delete_count` items, then emit the rest.
//
//  A negative `start` counts from the end: the head phase delays emission through a window of
//  `-start` items, and whatever the window holds when the upstream runs out becomes the front of
//  the tail phase.
//
template <typename Seq>
class Splice
{
   public:
    using Item = SeqItem<Seq>;

    enum Phase {
        kHead,
        kInsert,
        kTail,
        kDone,
    };

    explicit Splice(Seq&& seq, isize start, usize delete_count, std::vector<Item>&& inserted) noexcept
        : seq_(QRY_FORWARD(seq))
        , start_{start}
        , delete_count_{delete_count}
        , inserted_(std::move(inserted))
    {
    }

    Optional<Item> next()
    {
        for (;;) {
            switch (phase_) {
            case kHead: {
                Optional<Item> item = (start_ >= 0) ? this->next_head() : this->next_head_windowed();
                if (item) {
                    return item;
                }
                phase_ = kInsert;
                break;
            }
            case kInsert:
                if (insert_pos_ < inserted_.size()) {
                    return std::move(inserted_[insert_pos_++]);
                }
                inserted_.clear();
                phase_ = kTail;
                this->skip_deleted();
                break;

            case kTail:
                if (!window_.empty()) {
                    Item item = std::move(window_.front());
                    window_.pop_front();
                    return item;
                }
                if (!upstream_done_) {
                    Optional<Item> item = seq_.next();
                    if (item) {
                        return item;
                    }
                    upstream_done_ = true;
                }
                phase_ = kDone;
                break;

            case kDone:
                return None;
            }
        }
    }

   private:
    Optional<Item> next_head()
    {
        if (head_count_ >= static_cast<usize>(start_)) {
            return None;
        }
        Optional<Item> item = seq_.next();
        if (!item) {
            upstream_done_ = true;
            return None;
        }
        ++head_count_;
        return item;
    }

    Optional<Item> next_head_windowed()
    {
        const usize window_size = static_cast<usize>(-start_);

        while (!upstream_done_) {
            Optional<Item> item = seq_.next();
            if (!item) {
                upstream_done_ = true;
                break;
            }
            window_.emplace_back(std::move(*item));
            if (window_.size() > window_size) {
                Item oldest = std::move(window_.front());
                window_.pop_front();
                return oldest;
            }
        }
        QRY_ASSERT_LE(window_.size(), window_size);
        return None;
    }

    void skip_deleted()
    {
        while (delete_count_ != 0 && !window_.empty()) {
            window_.pop_front();
            --delete_count_;
        }
        while (delete_count_ != 0 && !upstream_done_) {
            if (!seq_.next()) {
                upstream_done_ = true;
                break;
            }
            --delete_count_;
        }
    }

    Seq seq_;
    isize start_;
    usize delete_count_;
    std::vector<Item> inserted_;
    usize insert_pos_ = 0;
    std::deque<Item> window_;
    usize head_count_ = 0;
    bool upstream_done_ = false;
    Phase phase_ = kHead;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_SPLICE_HPP

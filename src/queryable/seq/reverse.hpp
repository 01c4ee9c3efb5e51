//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_REVERSE_HPP
#define QUERYABLE_SEQ_REVERSE_HPP

#include <queryable/config.hpp>
//
#include <queryable/logging.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <utility>
#include <vector>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// reverse - the upstream items in reverse order.
//
//  The first pull drains the upstream into a buffer; items are then emitted from the back.  Never
//  produces an item if the upstream is infinite.
//
template <typename Seq>
class Reverse
{
   public:
    using Item = SeqItem<Seq>;

    explicit Reverse(Seq&& seq) noexcept : seq_(QRY_FORWARD(seq))
    {
    }

    Optional<Item> next()
    {
        if (!drained_) {
            for (;;) {
                Optional<Item> item = seq_.next();
                if (!item) {
                    break;
                }
                buffer_.emplace_back(std::move(*item));
            }
            drained_ = true;
            QRY_VLOG(2) << "reverse: buffered " << buffer_.size() << " items";
        }
        if (buffer_.empty()) {
            return None;
        }
        Item item = std::move(buffer_.back());
        buffer_.pop_back();
        return item;
    }

   private:
    Seq seq_;
    std::vector<Item> buffer_;
    bool drained_ = false;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_REVERSE_HPP

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_TAKE_N_HPP
#define QUERYABLE_SEQ_TAKE_N_HPP

#include <queryable/config.hpp>
//
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// TakeN<Seq>
//
//  Passes through at most `limit` items.  The upstream is not pulled again once the limit is
//  reached or the upstream reports its end.
//
template <typename Seq>
class TakeN
{
   public:
    using Item = SeqItem<Seq>;

    explicit TakeN(Seq&& upstream, usize limit) noexcept : upstream_(QRY_FORWARD(upstream)), remaining_{limit}
    {
    }

    Optional<Item> next()
    {
        if (this->remaining_ == 0) {
            return None;
        }
        Optional<Item> item = this->upstream_.next();
        this->remaining_ = item ? this->remaining_ - 1 : 0;
        return item;
    }

   private:
    Seq upstream_;
    usize remaining_;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_TAKE_N_HPP

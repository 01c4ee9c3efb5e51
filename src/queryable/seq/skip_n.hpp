//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_SKIP_N_HPP
#define QUERYABLE_SEQ_SKIP_N_HPP

#include <queryable/config.hpp>
//
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// SkipN<Seq>
//
//  Discards the first `count` items lazily, on the first pull.
//
template <typename Seq>
class SkipN
{
   public:
    using Item = SeqItem<Seq>;

    explicit SkipN(Seq&& upstream, usize count) noexcept : upstream_(QRY_FORWARD(upstream)), to_skip_{count}
    {
    }

    Optional<Item> next()
    {
        while (this->to_skip_ > 0 && !this->done_) {
            --this->to_skip_;
            this->done_ = !this->upstream_.next();
        }
        if (this->done_) {
            return None;
        }
        return this->upstream_.next();
    }

   private:
    Seq upstream_;
    usize to_skip_;
    bool done_ = false;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_SKIP_N_HPP

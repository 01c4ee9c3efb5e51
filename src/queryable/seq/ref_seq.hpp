//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_REF_SEQ_HPP
#define QUERYABLE_SEQ_REF_SEQ_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>
#include <queryable/seq/requirements.hpp>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// RefSeq - borrows another sequence; pulling from a RefSeq advances the referenced sequence.  The
// referenced sequence must outlive the RefSeq.
//
template <typename Seq>
class RefSeq
{
   public:
    using Item = SeqItem<Seq>;

    explicit RefSeq(Seq& seq) noexcept : seq_{&seq}
    {
    }

    Optional<Item> next()
    {
        return seq_->next();
    }

   private:
    Seq* seq_;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_REF_SEQ_HPP

#pragma once
#ifndef QUERYABLE_SEQ_FILTER_HPP
#define QUERYABLE_SEQ_FILTER_HPP

#include <queryable/config.hpp>
#include <queryable/int_types.hpp>
#include <queryable/optional.hpp>
#include <queryable/seq/invoke.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// filter
//
//  The index passed to the predicate counts every item examined, accepted or not.
//
template <typename Seq, typename Predicate>
class Filter
{
   public:
    using Item = SeqItem<Seq>;

    explicit Filter(Seq&& seq, Predicate&& predicate) noexcept
        : seq_(QRY_FORWARD(seq))
        , predicate_(QRY_FORWARD(predicate))
    {
    }

    Optional<Item> next()
    {
        for (;;) {
            Optional<Item> item = seq_.next();
            if (!item || invoke_predicate("filter", predicate_, *item, index_++, seq_)) {
                return item;
            }
        }
    }

   private:
    Seq seq_;
    Predicate predicate_;
    usize index_ = 0;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_FILTER_HPP

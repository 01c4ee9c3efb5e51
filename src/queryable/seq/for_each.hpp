//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_FOR_EACH_HPP
#define QUERYABLE_SEQ_FOR_EACH_HPP

#include <queryable/config.hpp>
//
#include <queryable/seq/requirements.hpp>
#include <queryable/utility.hpp>

#include <type_traits>
#include <utility>

namespace qry {
namespace seq {

/// Returned by a for_each body to stop the loop early.  A body that returns anything else (or
/// nothing) always continues.
///
enum LoopControl {
    kContinue = 0,
    kBreak = 1,
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// seq | for_each(fn)
//
//  Pulls until `seq` is exhausted or `fn` returns kBreak.  `seq` may be an lvalue, in which case
//  its cursor is left just past the last item handed to `fn`.
//
template <typename Fn>
struct ForEachBinder {
    Fn fn;
};

template <typename Fn>
inline ForEachBinder<Fn> for_each(Fn&& fn)
{
    return ForEachBinder<Fn>{QRY_FORWARD(fn)};
}

template <typename Seq, typename Fn, typename = EnableIfSeq<Seq>>
inline LoopControl operator|(Seq&& seq, ForEachBinder<Fn>&& binder)
{
    using Item = SeqItem<Seq>;
    using BodyResult = std::invoke_result_t<Fn&, Item&>;

    while (auto item = seq.next()) {
        if constexpr (std::is_same_v<BodyResult, LoopControl>) {
            if (QRY_HINT_FALSE(binder.fn(*item) == kBreak)) {
                return kBreak;
            }
        } else {
            binder.fn(*item);
        }
    }
    return kContinue;
}

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_FOR_EACH_HPP

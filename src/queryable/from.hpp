//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_FROM_HPP
#define QUERYABLE_FROM_HPP

#include <queryable/config.hpp>
//
#include <queryable/queryable_decl.hpp>
#include <queryable/seq/trivial.hpp>
#include <queryable/seq/iota.hpp>
#include <queryable/seq/range_seq.hpp>
#include <queryable/seq/ref_seq.hpp>
#include <queryable/seq/requirements.hpp>
#include <queryable/type_traits.hpp>
#include <queryable/utility.hpp>

#include <initializer_list>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace qry {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// from(source)
//
//  - from<T>()                   : the empty sequence
//  - from(queryable&&)           : the same Queryable
//  - from(seq&&), from(range&&)  : takes ownership of the source
//  - from(seq&), from(range&)    : borrows the source; it must outlive the returned Queryable.
//                                  Pulling from the result advances a borrowed sequence's cursor.
//  - from({a, b, c})             : an owned copy of the list
//
template <typename T>
Queryable<T> from()
{
    return Queryable<T>{seq::Empty<T>{}};
}

template <typename T>
Queryable<T> from(std::initializer_list<T> items)
{
    return Queryable<T>{seq::own_range(std::vector<T>(items))};
}

template <typename Src>
auto from(Src&& src)
{
    using Source = std::decay_t<Src>;

    constexpr bool kBorrow = std::is_lvalue_reference_v<Src>;

    if constexpr (IsQueryable<Source>{} && !kBorrow) {
        return Source{std::move(src)};

    } else if constexpr (has_seq_requirements<Source>()) {
        if constexpr (kBorrow) {
            return Queryable<SeqItem<Source>>{seq::RefSeq<Source>{src}};
        } else {
            return Queryable<SeqItem<Source>>{std::move(src)};
        }

    } else {
        static_assert(IsRange<Source&>{}, "qry::from requires a sequence (Item + next()) or a range");

        if constexpr (kBorrow) {
            auto sub_range = seq::borrow_range(src);
            return Queryable<SeqItem<decltype(sub_range)>>{std::move(sub_range)};
        } else {
            auto owned = seq::own_range(std::move(src));
            return Queryable<SeqItem<decltype(owned)>>{std::move(owned)};
        }
    }
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// of(args...) - a Queryable over the argument list; the item type is the common type of the
// arguments.
//
template <typename T>
Queryable<T> of()
{
    return from<T>();
}

template <typename First, typename... Rest>
auto of(First&& first, Rest&&... rest)
{
    using Item = std::common_type_t<std::decay_t<First>, std::decay_t<Rest>...>;

    std::vector<Item> items;
    items.reserve(1 + sizeof...(Rest));
    items.emplace_back(QRY_FORWARD(first));
    (items.emplace_back(QRY_FORWARD(rest)), ...);

    return from(std::move(items));
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// range(stop), range(start, stop, step = 1)
//
//  `start, start + step, ...` while less than `stop` (greater than `stop` if `step` is negative).
//  Infinite if `stop` is a floating point infinity.  Throws std::invalid_argument if `step` is zero.
//
template <typename Start, typename Stop, typename Step = int>
auto range(Start start, Stop stop, Step step = 1)
{
    using N = std::common_type_t<Start, Stop, Step>;

    static_assert(std::is_arithmetic_v<N>, "qry::range requires arithmetic arguments");

    if (step == Step{0}) {
        throw std::invalid_argument{"qry::range: step must be non-zero"};
    }
    return Queryable<N>{seq::Iota<N>{static_cast<N>(start), static_cast<N>(stop), static_cast<N>(step)}};
}

template <typename N>
auto range(N stop)
{
    return range(N{0}, stop, N{1});
}

}  // namespace qry

#endif  // QUERYABLE_FROM_HPP

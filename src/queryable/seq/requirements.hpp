//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_REQUIREMENTS_HPP
#define QUERYABLE_SEQ_REQUIREMENTS_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>
#include <queryable/type_traits.hpp>

#include <type_traits>

namespace qry {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A Seq is any type with:
//
//  - a nested value type `Item`
//  - a member function `next()` returning something convertible to `Optional<Item>`; None means
//    the sequence is exhausted
//
// Seqs are pulled from through non-const references and are normally moved, not copied.

/// The item type of a Seq (reference and cv qualifiers on `T` are ignored).
///
template <typename T>
using SeqItem = typename std::decay_t<T>::Item;

namespace detail {

template <typename T, typename = void>
struct HasSeqRequirementsImpl : std::false_type {
};

template <typename T>
struct HasSeqRequirementsImpl<
    T, std::void_t<typename T::Item, decltype(std::declval<T&>().next())>>
    : std::is_convertible<decltype(std::declval<T&>().next()), Optional<typename T::Item>> {
};

}  // namespace detail

template <typename T>
struct HasSeqRequirements : detail::HasSeqRequirementsImpl<std::decay_t<T>> {
};

template <typename T>
inline constexpr bool has_seq_requirements(StaticType<T> = {})
{
    return HasSeqRequirements<T>{};
}

template <typename T>
using EnableIfSeq = std::enable_if_t<HasSeqRequirements<T>{}>;

}  // namespace qry

#endif  // QUERYABLE_SEQ_REQUIREMENTS_HPP

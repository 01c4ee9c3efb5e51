//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_TYPE_TRAITS_HPP
#define QUERYABLE_TYPE_TRAITS_HPP

#include <queryable/config.hpp>
//

#include <boost/core/demangle.hpp>

#include <functional>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

namespace qry {

// =============================================================================
// IsCallable<Fn, Args...>
//
//  Type alias for std::true_type if `Fn` is callable with `Args...`.
//  Type alias for std::false_type otherwise.
//
template <typename Fn, typename... Args>
using IsCallable = std::is_invocable<Fn, Args...>;

// =============================================================================
// IsPrintable<T>
//
//  Derives std::true_type iff a `T` can be written to a std::ostream with `<<`.
//
template <typename T, typename = void>
struct IsPrintable : std::false_type {
};

template <typename T>
struct IsPrintable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T>())>>
    : std::true_type {
};

// =============================================================================
// IsRange<T>
//
//  Derives std::true_type iff `std::begin` and `std::end` accept a `T` and return the same
//  iterator type.
//
template <typename T, typename = void>
struct IsRange : std::false_type {
};

template <typename T>
struct IsRange<T, std::void_t<decltype(std::begin(std::declval<T>())), decltype(std::end(std::declval<T>()))>>
    : std::is_same<decltype(std::begin(std::declval<T>())), decltype(std::end(std::declval<T>()))> {
};

// =============================================================================
// IsString<T>
//
//  Strings are ranges of characters, but they are treated as scalar values when deciding whether
//  to flatten a sequence element.
//
template <typename T>
struct IsString : std::false_type {
};

template <typename CharT, typename Traits, typename Alloc>
struct IsString<std::basic_string<CharT, Traits, Alloc>> : std::true_type {
};

template <typename CharT, typename Traits>
struct IsString<std::basic_string_view<CharT, Traits>> : std::true_type {
};

// =============================================================================
// IsStdFunction<T>
//
template <typename T>
struct IsStdFunction : std::false_type {
};

template <typename Signature>
struct IsStdFunction<std::function<Signature>> : std::true_type {
};

// =============================================================================
// IsNullableCallable<Fn>
//
//  Derives std::true_type if a value of type `Fn` can be empty (null function pointers, member
//  pointers and default-constructed std::function objects).
//
template <typename Fn>
struct IsNullableCallable
    : std::integral_constant<bool, std::is_pointer_v<std::decay_t<Fn>> ||
                                       std::is_member_pointer_v<std::decay_t<Fn>> ||
                                       IsStdFunction<std::decay_t<Fn>>{}> {
};

// =============================================================================
// StaticType<T>
//
template <typename T>
struct StaticType {
    using type = T;
};

template <typename L, typename R>
inline constexpr bool operator==(StaticType<L>, StaticType<R>)
{
    return std::is_same_v<L, R>;
}
template <typename L, typename R>
inline constexpr bool operator!=(StaticType<L>, StaticType<R>)
{
    return !std::is_same_v<L, R>;
}

static_assert(StaticType<int>{} == StaticType<int>{}, "");
static_assert(StaticType<int>{} != StaticType<unsigned>{}, "");

// =============================================================================
// EnableIfNoShadow<T, Arg>
//
//  Removes a single-argument constructor template of `T` from overload resolution when `Arg` is
//  (a reference to) `T` itself, so that the copy and move constructors are not hidden.
//
template <typename T, typename Arg>
using EnableIfNoShadow = std::enable_if_t<!std::is_same_v<std::decay_t<Arg>, std::decay_t<T>>>;

// =============================================================================
// name_of<T>() - the demangled name of a type, for diagnostics.
//
template <typename T>
inline std::string name_of(StaticType<T> = {})
{
    return boost::core::demangle(typeid(T).name());
}

}  // namespace qry

#endif  // QUERYABLE_TYPE_TRAITS_HPP

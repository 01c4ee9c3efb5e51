//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_INVOKE_HPP
#define QUERYABLE_SEQ_INVOKE_HPP

#include <queryable/config.hpp>
//
#include <queryable/int_types.hpp>
#include <queryable/logging.hpp>
#include <queryable/type_traits.hpp>
#include <queryable/utility.hpp>

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// Combinator callbacks are invoked with the widest argument list they accept:
//
//   fn(item, index, upstream)
//   fn(item, index)
//   fn(item)
//
// Reducers receive the accumulator in front of the same argument list.

/// Throws std::invalid_argument if `fn` is an empty function pointer or std::function.
///
template <typename Fn>
inline void check_callback(const char* op_name, const Fn& fn)
{
    if constexpr (IsNullableCallable<Fn>{}) {
        if (QRY_HINT_FALSE(!fn)) {
            QRY_VLOG(1) << "qry::" << op_name << ": rejecting empty callback of type " << name_of<Fn>();
            throw std::invalid_argument{std::string{"qry::"} + op_name + ": callback of type " +
                                        name_of<Fn>() + " is empty"};
        }
    } else {
        (void)op_name;
        (void)fn;
    }
}

template <typename Fn, typename Item, typename Seq>
decltype(auto) invoke_callback(const char* op_name, Fn& fn, Item& item, usize index, Seq& seq)
{
    check_callback(op_name, fn);

    if constexpr (IsCallable<Fn&, Item&, usize, Seq&>{}) {
        return std::invoke(fn, item, index, seq);
    } else if constexpr (IsCallable<Fn&, Item&, usize>{}) {
        (void)seq;
        return std::invoke(fn, item, index);
    } else {
        static_assert(IsCallable<Fn&, Item&>{},
                      "Callbacks must accept (item), (item, index) or (item, index, seq)");
        (void)index;
        (void)seq;
        return std::invoke(fn, item);
    }
}

template <typename Fn, typename Item, typename Seq>
bool invoke_predicate(const char* op_name, Fn& fn, Item& item, usize index, Seq& seq)
{
    return static_cast<bool>(invoke_callback(op_name, fn, item, index, seq));
}

template <typename Fn, typename State, typename Item, typename Seq>
decltype(auto) invoke_reducer(const char* op_name, Fn& fn, State&& state, Item& item, usize index, Seq& seq)
{
    check_callback(op_name, fn);

    if constexpr (IsCallable<Fn&, State&&, Item&, usize, Seq&>{}) {
        return std::invoke(fn, QRY_FORWARD(state), item, index, seq);
    } else if constexpr (IsCallable<Fn&, State&&, Item&, usize>{}) {
        (void)seq;
        return std::invoke(fn, QRY_FORWARD(state), item, index);
    } else {
        static_assert(IsCallable<Fn&, State&&, Item&>{},
                      "Reducers must accept (acc, item), (acc, item, index) or (acc, item, index, seq)");
        (void)index;
        (void)seq;
        return std::invoke(fn, QRY_FORWARD(state), item);
    }
}

/// The type produced by invoking a callback of type `Fn` on an item of `Seq`.
///
template <typename Fn, typename Item, typename Seq>
using CallbackResult = decltype(invoke_callback("", std::declval<Fn&>(), std::declval<Item&>(), usize{},
                                                std::declval<Seq&>()));

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_INVOKE_HPP

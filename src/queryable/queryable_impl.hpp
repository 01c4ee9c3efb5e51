//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_QUERYABLE_IMPL_HPP
#define QUERYABLE_QUERYABLE_IMPL_HPP

#include <queryable/config.hpp>
//
#include <queryable/from.hpp>
#include <queryable/queryable_decl.hpp>
#include <queryable/same_value.hpp>

#include <queryable/seq/chain.hpp>
#include <queryable/seq/drop_last.hpp>
#include <queryable/seq/filter.hpp>
#include <queryable/seq/flatten.hpp>
#include <queryable/seq/for_each.hpp>
#include <queryable/seq/invoke.hpp>
#include <queryable/seq/map.hpp>
#include <queryable/seq/reverse.hpp>
#include <queryable/seq/trivial.hpp>
#include <queryable/seq/skip_n.hpp>
#include <queryable/seq/splice.hpp>
#include <queryable/seq/take_last.hpp>
#include <queryable/seq/take_n.hpp>

#include <limits>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <utility>
#include <vector>

namespace qry {
namespace detail {

// Items of these types are expanded by `flat()`; everything else (including strings) is a leaf.
//
template <typename T>
struct IsFlattenable
    : std::integral_constant<bool, IsQueryable<T>{} || has_seq_requirements<T>() ||
                                       (IsRange<T&>{} && !IsString<T>{})> {
};

// Converts one argument of `concat` into a Queryable<T> segment.
//
template <typename T, typename Arg>
Queryable<T> concat_segment(Arg&& arg)
{
    if constexpr (std::is_convertible_v<Arg&&, T>) {
        return Queryable<T>{seq::single_item(T(QRY_FORWARD(arg)))};
    } else {
        auto segment = from(QRY_FORWARD(arg));
        using SegmentItem = SeqItem<decltype(segment)>;

        static_assert(std::is_constructible_v<T, SegmentItem&&>,
                      "concat arguments must be items, or ranges/sequences of items");

        if constexpr (std::is_same_v<SegmentItem, T>) {
            return segment;
        } else {
            return Queryable<T>{std::move(segment)};
        }
    }
}

template <typename T, typename... Items>
std::vector<T> collect_args(Items&&... items)
{
    std::vector<T> v;
    v.reserve(sizeof...(Items));
    (v.emplace_back(QRY_FORWARD(items)), ...);
    return v;
}

// Writes one item for `join`.  Floating point items use the fewest digits (of `digits10` or
// `max_digits10`) that read back as the same value.
//
template <typename T>
void write_join_item(std::ostream& out, const T& item)
{
    if constexpr (std::is_floating_point_v<T>) {
        std::ostringstream short_form;
        short_form.precision(std::numeric_limits<T>::digits10);
        short_form << item;

        T parsed{};
        std::istringstream in{short_form.str()};
        in >> parsed;

        if (parsed == item) {
            out << short_form.str();
        } else {
            const std::streamsize saved = out.precision(std::numeric_limits<T>::max_digits10);
            out << item;
            out.precision(saved);
        }
    } else {
        out << item;
    }
}

}  // namespace detail

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// Transformation stages.

template <typename T>
template <typename Fn>
inline auto Queryable<T>::map(Fn&& fn) &&
{
    using MapFn = std::decay_t<Fn>;
    using Stage = seq::Map<Queryable, MapFn>;

    return Queryable<SeqItem<Stage>>{Stage{std::move(*this), MapFn(QRY_FORWARD(fn))}};
}

template <typename T>
template <typename Fn>
inline Queryable<T> Queryable<T>::filter(Fn&& fn) &&
{
    using Predicate = std::decay_t<Fn>;

    return Queryable{seq::Filter<Queryable, Predicate>{std::move(*this), Predicate(QRY_FORWARD(fn))}};
}

template <typename T>
template <typename... Items>
inline Queryable<T> Queryable<T>::concat(Items&&... items) &&
{
    std::vector<Queryable> segments;
    segments.reserve(sizeof...(Items));
    (segments.emplace_back(detail::concat_segment<T>(QRY_FORWARD(items))), ...);

    return Queryable{seq::chain(std::move(*this), from(std::move(segments)).flat())};
}

template <typename T>
template <typename... Items>
inline Queryable<T> Queryable<T>::push(Items&&... items) &&
{
    return Queryable{seq::chain(std::move(*this), from(detail::collect_args<T>(QRY_FORWARD(items)...)))};
}

template <typename T>
template <typename... Items>
inline Queryable<T> Queryable<T>::unshift(Items&&... items) &&
{
    return Queryable{seq::chain(from(detail::collect_args<T>(QRY_FORWARD(items)...)), std::move(*this))};
}

template <typename T>
inline auto Queryable<T>::flat() &&
{
    if constexpr (detail::IsFlattenable<T>{}) {
        using Stage = seq::Flatten<Queryable>;

        return Queryable<SeqItem<Stage>>{Stage{std::move(*this)}};
    } else {
        return std::move(*this);
    }
}

template <typename T>
template <typename Fn>
inline auto Queryable<T>::flat_map(Fn&& fn) &&
{
    return std::move(*this).map(QRY_FORWARD(fn)).flat();
}

template <typename T>
inline Queryable<usize> Queryable<T>::keys() &&
{
    return std::move(*this).map([](const T&, usize index) {
        return index;
    });
}

template <typename T>
inline Queryable<T> Queryable<T>::values() &&
{
    return std::move(*this);
}

template <typename T>
inline Queryable<std::pair<usize, T>> Queryable<T>::entries() &&
{
    return std::move(*this).map([](T& item, usize index) {
        return std::pair<usize, T>{index, std::move(item)};
    });
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// Windowed consumption stages.

template <typename T>
inline Queryable<T> Queryable<T>::shift(usize length) &&
{
    return Queryable{seq::SkipN<Queryable>{std::move(*this), length}};
}

template <typename T>
inline Queryable<T> Queryable<T>::pop(usize length) &&
{
    return Queryable{seq::DropLast<Queryable>{std::move(*this), length}};
}

template <typename T>
inline Queryable<T> Queryable<T>::slice(isize begin) &&
{
    if (begin >= 0) {
        return std::move(*this).shift(static_cast<usize>(begin));
    }
    return Queryable{seq::TakeLast<Queryable>{std::move(*this), static_cast<usize>(-begin), None}};
}

template <typename T>
inline Queryable<T> Queryable<T>::slice(isize begin, isize end) &&
{
    if (begin >= 0) {
        Queryable rest = std::move(*this).shift(static_cast<usize>(begin));
        if (end < 0) {
            return std::move(rest).pop(static_cast<usize>(-end));
        }
        const usize count = (end > begin) ? static_cast<usize>(end - begin) : 0;
        return Queryable{seq::TakeN<Queryable>{std::move(rest), count}};
    }

    // Negative `begin`: keep the last `-begin` items, clipped by `end`.
    //
    Optional<usize> stop_index;
    if (end >= 0) {
        stop_index = static_cast<usize>(end);
    }
    Queryable tail{seq::TakeLast<Queryable>{std::move(*this), static_cast<usize>(-begin), stop_index}};
    if (end < 0) {
        return std::move(tail).pop(static_cast<usize>(-end));
    }
    return tail;
}

template <typename T>
inline Queryable<T> Queryable<T>::splice(isize start) &&
{
    return std::move(*this).splice(start, std::numeric_limits<usize>::max());
}

template <typename T>
template <typename... Items>
inline Queryable<T> Queryable<T>::splice(isize start, usize delete_count, Items&&... new_items) &&
{
    return Queryable{seq::Splice<Queryable>{std::move(*this), start, delete_count,
                                            detail::collect_args<T>(QRY_FORWARD(new_items)...)}};
}

template <typename T>
inline Queryable<T> Queryable<T>::reverse() &&
{
    return Queryable{seq::Reverse<Queryable>{std::move(*this)}};
}

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
// Terminal operations.

template <typename T>
template <typename Fn>
inline isize Queryable<T>::find_index(Fn&& fn)
{
    isize found = -1;
    usize index = 0;

    *this | seq::for_each([&](T& item) {
        if (seq::invoke_predicate("find_index", fn, item, index, *this)) {
            found = static_cast<isize>(index);
            return seq::kBreak;
        }
        ++index;
        return seq::kContinue;
    });

    return found;
}

template <typename T>
template <typename Fn>
inline Optional<T> Queryable<T>::find(Fn&& fn)
{
    Optional<T> found;
    usize index = 0;

    *this | seq::for_each([&](T& item) {
        if (seq::invoke_predicate("find", fn, item, index++, *this)) {
            found = std::move(item);
            return seq::kBreak;
        }
        return seq::kContinue;
    });

    return found;
}

template <typename T>
template <typename Fn>
inline bool Queryable<T>::some(Fn&& fn)
{
    return this->find_index(QRY_FORWARD(fn)) >= 0;
}

template <typename T>
template <typename Fn>
inline bool Queryable<T>::every(Fn&& fn)
{
    return !this->some([&fn](T& item, usize index, Queryable& upstream) {
        return !seq::invoke_predicate("every", fn, item, index, upstream);
    });
}

template <typename T>
template <typename U>
inline isize Queryable<T>::index_of(const U& item, usize start_index)
{
    const isize found = from(*this).shift(start_index).find_index([&item](const T& candidate) {
        return strict_equals(candidate, item);
    });

    if (found < 0) {
        return found;
    }
    return found + static_cast<isize>(start_index);
}

template <typename T>
template <typename U>
inline isize Queryable<T>::last_index_of(const U& item, usize skip_from_end)
{
    const std::vector<T> items = this->collect_vec();
    if (skip_from_end >= items.size()) {
        return -1;
    }
    for (usize i = items.size() - skip_from_end; i != 0; --i) {
        if (strict_equals(items[i - 1], item)) {
            return static_cast<isize>(i - 1);
        }
    }
    return -1;
}

template <typename T>
template <typename U>
inline bool Queryable<T>::includes(const U& item, usize start_index)
{
    return from(*this).shift(start_index).some([&item](const T& candidate) {
        return same_value_equals(candidate, item);
    });
}

template <typename T>
template <typename Fn>
inline void Queryable<T>::for_each(Fn&& fn)
{
    usize index = 0;

    *this | seq::for_each([&](T& item) {
        (void)seq::invoke_callback("for_each", fn, item, index++, *this);
    });
}

template <typename T>
template <typename Fn>
inline Optional<T> Queryable<T>::reduce(Fn&& fn)
{
    Optional<T> seed = this->next();
    if (!seed) {
        return None;
    }
    return this->reduce(QRY_FORWARD(fn), std::move(*seed));
}

template <typename T>
template <typename Fn, typename State>
inline std::decay_t<State> Queryable<T>::reduce(Fn&& fn, State&& initial_value)
{
    std::decay_t<State> state = QRY_FORWARD(initial_value);
    usize index = 0;

    *this | seq::for_each([&](T& item) {
        state = seq::invoke_reducer("reduce", fn, std::move(state), item, index++, *this);
    });

    return state;
}

template <typename T>
template <typename Fn>
inline Optional<T> Queryable<T>::reduce_right(Fn&& fn)
{
    return from(*this).reverse().reduce(QRY_FORWARD(fn));
}

template <typename T>
template <typename Fn, typename State>
inline std::decay_t<State> Queryable<T>::reduce_right(Fn&& fn, State&& initial_value)
{
    return from(*this).reverse().reduce(QRY_FORWARD(fn), QRY_FORWARD(initial_value));
}

template <typename T>
inline std::string Queryable<T>::join(std::string_view separator)
{
    static_assert(IsPrintable<const T&>{}, "join requires items that can be written to a std::ostream");

    std::ostringstream oss;
    oss << std::boolalpha;

    bool first = true;
    *this | seq::for_each([&](const T& item) {
        if (!first) {
            oss << separator;
        }
        first = false;
        detail::write_join_item(oss, item);
    });

    return std::move(oss).str();
}

template <typename T>
inline std::vector<T> Queryable<T>::collect_vec()
{
    std::vector<T> items;

    *this | seq::for_each([&items](T& item) {
        items.emplace_back(std::move(item));
    });

    return items;
}

}  // namespace qry

#endif  // QUERYABLE_QUERYABLE_IMPL_HPP

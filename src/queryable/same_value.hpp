//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SAME_VALUE_HPP
#define QUERYABLE_SAME_VALUE_HPP

#include <queryable/config.hpp>
//

#include <cmath>
#include <type_traits>

namespace qry {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// strict_equals(a, b) - plain `==`; NaN never matches anything, +0.0 matches -0.0.
//
template <typename L, typename R>
inline bool strict_equals(const L& left, const R& right)
{
    return left == right;
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// same_value_equals(a, b) - like strict_equals, except that NaN matches NaN and +0.0 does not
// match -0.0.
//
template <typename L, typename R>
inline bool same_value_equals(const L& left, const R& right)
{
    if constexpr (std::is_floating_point_v<L> || std::is_floating_point_v<R>) {
        if constexpr (std::is_arithmetic_v<L> && std::is_arithmetic_v<R>) {
            const bool left_nan = std::isnan(left);
            const bool right_nan = std::isnan(right);
            if (left_nan || right_nan) {
                return left_nan && right_nan;
            }
            return left == right && std::signbit(left) == std::signbit(right);
        } else {
            return left == right;
        }
    } else {
        return left == right;
    }
}

}  // namespace qry

#endif  // QUERYABLE_SAME_VALUE_HPP

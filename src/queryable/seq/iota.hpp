//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_SEQ_IOTA_HPP
#define QUERYABLE_SEQ_IOTA_HPP

#include <queryable/config.hpp>
//
#include <queryable/optional.hpp>

#include <type_traits>

namespace qry {
namespace seq {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// Iota - the arithmetic progression `start, start + step, ...` up to (not including) `stop`.
//
//  A positive step ascends while the value is less than `stop`; a negative step descends while the
//  value is greater than `stop`.  The step must be non-zero.
//
template <typename N>
class Iota
{
   public:
    static_assert(std::is_arithmetic_v<N>, "Iota requires an arithmetic type");

    using Item = N;

    explicit Iota(N start, N stop, N step) noexcept : value_{start}, stop_{stop}, step_{step}
    {
    }

    Optional<Item> next()
    {
        if (done_ || !this->in_bounds()) {
            done_ = true;
            return None;
        }
        const N current = value_;

        if (this->last_step_from(current)) {
            done_ = true;
        } else {
            value_ += step_;
        }
        return current;
    }

   private:
    // True if `current + step_` would reach or pass `stop_`.  Integer distances are measured in the
    // unsigned type so that neither the subtraction nor the following step can overflow.
    //
    bool last_step_from(N current) const
    {
        if constexpr (std::is_integral_v<N>) {
            using U = std::make_unsigned_t<N>;

            if (step_ > N{0}) {
                return U(U(stop_) - U(current)) <= U(step_);
            }
            return U(U(current) - U(stop_)) <= U(U(0) - U(step_));
        } else {
            return step_ > N{0} ? (stop_ - current <= step_) : (current - stop_ <= -step_);
        }
    }

    bool in_bounds() const
    {
        return step_ > N{0} ? value_ < stop_ : value_ > stop_;
    }

    N value_;
    N stop_;
    N step_;
    bool done_ = false;
};

}  // namespace seq
}  // namespace qry

#endif  // QUERYABLE_SEQ_IOTA_HPP

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_ASSERT_HPP
#define QUERYABLE_ASSERT_HPP

#include <queryable/config.hpp>
//
#include <queryable/type_traits.hpp>
#include <queryable/utility.hpp>

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <type_traits>

#ifdef QRY_GLOG_AVAILABLE
#include <glog/logging.h>
#define QRY_FAIL_CHECK_OUT LOG(ERROR)
#else
#define QRY_FAIL_CHECK_OUT std::cerr
#endif

namespace qry {

/// Passes printable values through unchanged; anything else is printed as its type name.
///
template <typename T, typename = std::enable_if_t<IsPrintable<T>{}>>
decltype(auto) make_printable(T&& obj)
{
    return QRY_FORWARD(obj);
}

template <typename T, typename = std::enable_if_t<!IsPrintable<T>{}>, typename = void>
std::string make_printable(T&&)
{
    return "(" + name_of<std::decay_t<T>>() + ")";
}

namespace detail {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Accumulates the report for a failed check; the destructor writes it out and aborts the
// process.  Reports from concurrent failures are not interleaved.
//
class CheckFailure
{
   public:
    explicit CheckFailure(const char* file, int line, const char* function) noexcept
    {
        this->out_ << "FATAL: " << file << ":" << line << ": ";
        this->function_ = function;
    }

    CheckFailure(const CheckFailure&) = delete;
    CheckFailure& operator=(const CheckFailure&) = delete;

    ~CheckFailure()
    {
        static std::mutex m;
        m.lock();

        QRY_FAIL_CHECK_OUT << this->out_.str() << std::endl << std::endl;
        std::abort();
    }

    template <typename L, typename R>
    CheckFailure& relation(const char* left_str, const L& left, const char* op_str, const char* right_str,
                           const R& right)
    {
        this->out_ << "Assertion failed: " << left_str << " " << op_str << " " << right_str << "\n (in `"
                   << this->function_ << "`)\n\n"
                   << "  " << left_str << " == " << make_printable(left) << "\n\n"
                   << "  " << right_str << " == " << make_printable(right) << "\n\n";
        return *this;
    }

    CheckFailure& panic()
    {
        this->out_ << "*** PANIC *** (in `" << this->function_ << "`)\n";
        return *this;
    }

    template <typename T>
    CheckFailure& operator<<(const T& value)
    {
        this->out_ << make_printable(value);
        return *this;
    }

   private:
    std::ostringstream out_;
    const char* function_;
};

}  // namespace detail

// =============================================================================
// QRY_CHECK* are always enabled; QRY_ASSERT* compile to nothing (without evaluating their
// arguments) when NDEBUG is defined.  Both accept `<< message` after the macro:
//
//   QRY_CHECK_LE(window_.size(), n_) << "window overflow";
//
#define QRY_CHECK_RELATION(left, op, right)                                                                  \
    if (QRY_HINT_TRUE((left)op(right))) {                                                                    \
    } else                                                                                                   \
        ::qry::detail::CheckFailure(__FILE__, __LINE__, __PRETTY_FUNCTION__).relation(#left, (left), #op,    \
                                                                                      #right, (right))

#define QRY_CHECK(x) QRY_CHECK_RELATION(bool{x}, ==, true)
#define QRY_CHECK_EQ(x, y) QRY_CHECK_RELATION(x, ==, y)
#define QRY_CHECK_NE(x, y) QRY_CHECK_RELATION(x, !=, y)
#define QRY_CHECK_GE(x, y) QRY_CHECK_RELATION(x, >=, y)
#define QRY_CHECK_GT(x, y) QRY_CHECK_RELATION(x, >, y)
#define QRY_CHECK_LE(x, y) QRY_CHECK_RELATION(x, <=, y)
#define QRY_CHECK_LT(x, y) QRY_CHECK_RELATION(x, <, y)

#ifndef NDEBUG

#define QRY_ASSERT(x) QRY_CHECK(x)
#define QRY_ASSERT_EQ(x, y) QRY_CHECK_EQ(x, y)
#define QRY_ASSERT_NE(x, y) QRY_CHECK_NE(x, y)
#define QRY_ASSERT_GE(x, y) QRY_CHECK_GE(x, y)
#define QRY_ASSERT_GT(x, y) QRY_CHECK_GT(x, y)
#define QRY_ASSERT_LE(x, y) QRY_CHECK_LE(x, y)
#define QRY_ASSERT_LT(x, y) QRY_CHECK_LT(x, y)

#else  // NDEBUG

#define QRY_ASSERT(x) while (false) QRY_CHECK(x)
#define QRY_ASSERT_EQ(x, y) while (false) QRY_CHECK_EQ(x, y)
#define QRY_ASSERT_NE(x, y) while (false) QRY_CHECK_NE(x, y)
#define QRY_ASSERT_GE(x, y) while (false) QRY_CHECK_GE(x, y)
#define QRY_ASSERT_GT(x, y) while (false) QRY_CHECK_GT(x, y)
#define QRY_ASSERT_LE(x, y) while (false) QRY_CHECK_LE(x, y)
#define QRY_ASSERT_LT(x, y) while (false) QRY_CHECK_LT(x, y)

#endif  // NDEBUG

#define QRY_PANIC() ::qry::detail::CheckFailure(__FILE__, __LINE__, __PRETTY_FUNCTION__).panic()

}  // namespace qry

#endif  // QUERYABLE_ASSERT_HPP

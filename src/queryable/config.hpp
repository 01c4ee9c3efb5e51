//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_CONFIG_HPP
#define QUERYABLE_CONFIG_HPP

#if __cplusplus < 201703L
#error Queryable requires C++17 or later!
#endif

// Build-time options (pass with -D, or let CMake set them):
//
//  QRY_GLOG_AVAILABLE  Route QRY_LOG/QRY_VLOG and check-failure reports through Google Log.
//
//#define QRY_GLOG_AVAILABLE

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Compiler detection.
//
#if defined(__clang__)
#define QRY_COMPILER_IS_CLANG 1
#define QRY_COMPILER_IS_GCC 0
#elif defined(__GNUC__)
#define QRY_COMPILER_IS_CLANG 0
#define QRY_COMPILER_IS_GCC 1
#else
#define QRY_COMPILER_IS_CLANG 0
#define QRY_COMPILER_IS_GCC 0
#endif

// GCC reports spurious maybe-uninitialized warnings for boost::optional payloads moved through
// the stage chain.
//
#if QRY_COMPILER_IS_GCC
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Branch prediction hints.
//
#if QRY_COMPILER_IS_GCC || QRY_COMPILER_IS_CLANG
#define QRY_HINT_TRUE(expr) __builtin_expect(static_cast<bool>(expr), 1)
#define QRY_HINT_FALSE(expr) __builtin_expect(static_cast<bool>(expr), 0)
#else
#define QRY_HINT_TRUE(expr) static_cast<bool>(expr)
#define QRY_HINT_FALSE(expr) static_cast<bool>(expr)
#endif

#endif  // QUERYABLE_CONFIG_HPP

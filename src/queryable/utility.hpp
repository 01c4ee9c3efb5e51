//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_UTILITY_HPP
#define QUERYABLE_UTILITY_HPP

#include <queryable/config.hpp>
//

#include <utility>

namespace qry {

// =============================================================================

/// Perfectly forward `x`.  Avoids having to include redundant information in a `std::forward`
/// expression.
///
#define QRY_FORWARD(x) std::forward<decltype(x)>(x)

}  // namespace qry

#endif  // QUERYABLE_UTILITY_HPP

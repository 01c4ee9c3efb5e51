//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_INT_TYPES_HPP
#define QUERYABLE_INT_TYPES_HPP

#include <queryable/config.hpp>
//

#include <cstddef>
#include <type_traits>

namespace qry {
namespace int_types {

using usize = std::size_t;
using isize = std::make_signed_t<std::size_t>;

}  // namespace int_types

using namespace int_types;

}  // namespace qry

#endif  // QUERYABLE_INT_TYPES_HPP

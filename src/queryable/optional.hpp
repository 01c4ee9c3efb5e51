//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2021-2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_OPTIONAL_HPP
#define QUERYABLE_OPTIONAL_HPP

#include <queryable/config.hpp>
//

#include <boost/optional.hpp>
#include <boost/optional/optional_io.hpp>

namespace qry {

template <typename T>
using Optional = boost::optional<T>;

namespace {
decltype(auto) None = boost::none;
}  // namespace

}  // namespace qry

#endif  // QUERYABLE_OPTIONAL_HPP

// Convenience header to include all of the Queryable library.
//
#pragma once

#include "queryable/assert.hpp"
#include "queryable/config.hpp"
#include "queryable/from.hpp"
#include "queryable/int_types.hpp"
#include "queryable/optional.hpp"
#include "queryable/queryable_decl.hpp"
#include "queryable/queryable_impl.hpp"
#include "queryable/same_value.hpp"
#include "queryable/type_traits.hpp"
#include "queryable/utility.hpp"

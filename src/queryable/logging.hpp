//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// Copyright 2022 Anthony Paul Astolfi
//
#pragma once
#ifndef QUERYABLE_LOGGING_HPP
#define QUERYABLE_LOGGING_HPP

#include <queryable/config.hpp>
//

// QRY_LOG(severity), QRY_DLOG(severity), QRY_VLOG(verbosity)
//
//  Stream-style logging.  With QRY_GLOG_AVAILABLE these are glog's LOG, DLOG and VLOG; otherwise
//  the streamed operands are type-checked but never evaluated.
//
#ifdef QRY_GLOG_AVAILABLE

#include <glog/logging.h>

#define QRY_LOG(severity) LOG(severity)
#define QRY_DLOG(severity) DLOG(severity)
#define QRY_VLOG(verbosity) VLOG(verbosity)
#define QRY_VLOG_IS_ON(verbosity) VLOG_IS_ON(verbosity)

#else  // QRY_GLOG_AVAILABLE ==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

#include <ostream>

namespace qry {
namespace detail {

class NullLogStream
{
   public:
    template <typename T>
    NullLogStream& operator<<(const T&)
    {
        return *this;
    }

    NullLogStream& operator<<(std::ostream& (*)(std::ostream&))
    {
        return *this;
    }
};

}  // namespace detail
}  // namespace qry

#define QRY_LOG_DISABLED                                                                                     \
    if (true) {                                                                                              \
    } else                                                                                                   \
        ::qry::detail::NullLogStream {}

#define QRY_LOG(severity) QRY_LOG_DISABLED
#define QRY_DLOG(severity) QRY_LOG_DISABLED
#define QRY_VLOG(verbosity) QRY_LOG_DISABLED
#define QRY_VLOG_IS_ON(verbosity) false

#endif  // QRY_GLOG_AVAILABLE

#endif  // QUERYABLE_LOGGING_HPP

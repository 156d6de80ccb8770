//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_STATUS_HPP
#define LOGSPOOL_STATUS_HPP

#include <logspool/logging.hpp>
#include <logspool/status_code.hpp>

#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace logspool {

using batt::None;
using batt::OkStatus;
using batt::Optional;
using batt::Status;
using batt::status_from_errno;
using batt::status_from_retval;
using batt::StatusOr;

#define LOGSPOOL_WARN_IF_NOT_OK(expr)                                                              \
  for (auto BOOST_PP_CAT(logspool_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));      \
       BATT_HINT_FALSE(BOOST_PP_CAT(logspool_TmpStatusResult, __LINE__) &&                         \
                       !BOOST_PP_CAT(logspool_TmpStatusResult, __LINE__)->ok());                   \
       BOOST_PP_CAT(logspool_TmpStatusResult, __LINE__) = ::batt::None)                            \
  LOGSPOOL_LOG_WARNING() << "Expected OK result, but got: \n\n"                                    \
                         << BOOST_PP_STRINGIZE((expr)) << " == "                                   \
                         << BOOST_PP_CAT(logspool_TmpStatusResult, __LINE__) << "\n\n"

}  // namespace logspool

#endif  // LOGSPOOL_STATUS_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef LOGSPOOL_LOGGING_HPP
#define LOGSPOOL_LOGGING_HPP

#include <logspool/config.hpp>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LOGSPOOL_DISABLE_LOGGING)

// Nothing to include!

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LOGSPOOL_USE_GLOG)

#include <glog/logging.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LOGSPOOL_USE_SELF_LOGGING)

#include <batteries/stream_util.hpp>

#include <atomic>
#include <chrono>
#include <iostream>

#include <errno.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#else

#error No Logging Impl Selected!

#endif

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

#include <ostream>

namespace logspool {

namespace detail {
struct NullStream {
  template <typename Arg>
  const NullStream& operator<<(Arg&&) const noexcept
  {
    return *this;
  }

  const NullStream& operator<<(std::ostream& (*)(std::ostream&)) const noexcept
  {
    return *this;
  }
};
}  // namespace detail

#define LOGSPOOL_LOG_NO_OUTPUT()                                                                   \
  if (false)                                                                                       \
  (::logspool::detail::NullStream{})

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LOGSPOOL_DISABLE_LOGGING)

#define LOGSPOOL_LOG_ERROR() LOGSPOOL_LOG_NO_OUTPUT()
#define LOGSPOOL_LOG_WARNING() LOGSPOOL_LOG_NO_OUTPUT()
#define LOGSPOOL_LOG_INFO() LOGSPOOL_LOG_NO_OUTPUT()
#define LOGSPOOL_VLOG(verbosity) LOGSPOOL_LOG_NO_OUTPUT()
#define LOGSPOOL_PLOG_ERROR() LOGSPOOL_LOG_NO_OUTPUT()

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LOGSPOOL_USE_GLOG)

#define LOGSPOOL_LOG_ERROR() LOG_IF(ERROR, !::logspool::suppress_log_output_for_test())
#define LOGSPOOL_LOG_WARNING() LOG_IF(WARNING, !::logspool::suppress_log_output_for_test())
#define LOGSPOOL_LOG_INFO() LOG(INFO)
#define LOGSPOOL_VLOG(verbosity) VLOG((verbosity))
#define LOGSPOOL_PLOG_ERROR() PLOG_IF(ERROR, !::logspool::suppress_log_output_for_test())

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LOGSPOOL_USE_SELF_LOGGING)

inline std::atomic<int> LogSeverityFilter{2};

#define LOGSPOOL_LOG_OUTPUT(level_name)                                                            \
  for (bool LoGsPoOl_LoG_LooP_FLaG = true; LoGsPoOl_LoG_LooP_FLaG;                                 \
       LoGsPoOl_LoG_LooP_FLaG = false, std::cerr << std::endl)                                     \
  std::cerr << "["                                                                                 \
            << (std::chrono::duration_cast<std::chrono::microseconds>(                             \
                    std::chrono::steady_clock::now().time_since_epoch())                           \
                    .count())                                                                      \
            << "] " << (level_name) << " "

#define LOGSPOOL_LOG_SEVERITY(level, level_name)                                                   \
  if (::logspool::LogSeverityFilter >= (level) &&                                                  \
      ((level) > 1 || !::logspool::suppress_log_output_for_test()))                                \
  LOGSPOOL_LOG_OUTPUT((level_name))

#define LOGSPOOL_LOG_ERROR() LOGSPOOL_LOG_SEVERITY(0, "ERROR")
#define LOGSPOOL_LOG_WARNING() LOGSPOOL_LOG_SEVERITY(1, "WARNING")
#define LOGSPOOL_LOG_INFO() LOGSPOOL_LOG_SEVERITY(2, "INFO")
#define LOGSPOOL_VLOG(verbosity) LOGSPOOL_LOG_SEVERITY(2 + (verbosity), "INFO")
#define LOGSPOOL_PLOG_ERROR() LOGSPOOL_LOG_ERROR() << BATT_INSPECT(errno)

#endif

//+++++++++++-+-+--+----- --- -- -  -  -   -

#define LOGSPOOL_DLOG_INFO()                                                                       \
  if (::logspool::kDebugBuild)                                                                     \
  LOGSPOOL_LOG_INFO()

#define LOGSPOOL_DVLOG(verbosity)                                                                  \
  if (::logspool::kDebugBuild)                                                                     \
  LOGSPOOL_VLOG((verbosity))

}  // namespace logspool

#endif  // LOGSPOOL_LOGGING_HPP

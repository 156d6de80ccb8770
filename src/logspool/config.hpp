//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_CONFIG_HPP
#define LOGSPOOL_CONFIG_HPP

#include <logspool/int_types.hpp>

#include <batteries/constants.hpp>

#include <atomic>
#include <chrono>

namespace logspool {

using namespace ::batt::constants;

//+++++++++++-+-+--+----- --- -- -  -  -   -
#ifdef __linux__
#define LOGSPOOL_PLATFORM_IS_LINUX 1
#else
#undef LOGSPOOL_PLATFORM_IS_LINUX
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// The placeholder that every Writer file name template must contain; it is replaced by the
// per-bucket version number.
//
constexpr const char* kLogVersionVariable = "LOG_VERSION";

// The highest version a Writer will try within one rotation bucket before giving up.  Reaching
// this limit means the file name template produces colliding names; it is not a transient
// condition.
//
constexpr i32 kMaxLogVersion = 10;

// How often the Writer background thread re-evaluates the rotation bucket when there is no write
// traffic.
//
constexpr std::chrono::milliseconds kDefaultWriterRefreshInterval{10 * 1000};

// Default size of the (uncompressed) stream buffer used by Writer output files.
//
constexpr usize kDefaultWriterBufferSize = 8 * kKiB;

// The suffix appended to a log file name to form the path of its metadata sidecar.
//
constexpr const char* kMetadataFileSuffix = ".metadata.yaml";

// Name of the directory (under the Writer's log directory) that receives quarantined files.
//
constexpr const char* kCorruptedDirName = ".corrupted";

// The size of a single read from a file while validating or scanning it.
//
constexpr usize kFileScanChunkSize = 64 * kKiB;

// ** FOR TESTING ONLY **
//
// Suppress ERROR/WARNING level output for expected errors while running unit tests.
//
inline std::atomic<bool>& suppress_log_output_for_test()
{
  static std::atomic<bool> value_{false};
  return value_;
}

// Used in the code to react to debug/release builds.
//
#ifndef NDEBUG
constexpr bool kDebugBuild = true;
#else
constexpr bool kDebugBuild = false;
#endif

// Logging configuration; uncomment one of the lines below to select the logging implementation.
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//#define LOGSPOOL_DISABLE_LOGGING
#define LOGSPOOL_USE_GLOG
//#define LOGSPOOL_USE_SELF_LOGGING
//+++++++++++-+-+--+----- --- -- -  -  -   -

}  // namespace logspool

#endif  // LOGSPOOL_CONFIG_HPP

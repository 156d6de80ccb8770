//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_STATUS_CODE_HPP
#define LOGSPOOL_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace logspool {

enum struct StatusCode {
  kOk = 0,
  kFilePatternMissingVersion = 1,
  kUnknownFilePatternVariable = 2,
  kNoBufferConfiguration = 3,
  kRecordTooLarge = 4,
  kBuffersClosed = 5,
  kBuffersAlreadyClosed = 6,
  kTooManyLogVersions = 7,
  kLogIdFieldTooLong = 8,
  kLogIdHeaderTruncated = 9,
  kCheckpointBadMagic = 10,
  kCheckpointBadVersion = 11,
  kCheckpointTruncated = 12,
  kCheckpointBadCrc = 13,
  kCheckpointBadBufferRecord = 14,
  kMetadataParseFailed = 15,
  kGzipOpenFailed = 16,
  kGzipWriteFailed = 17,
  kGzipCloseFailed = 18,
  kGzipReadFailed = 19,
  kWriterClosed = 20,
  kInvalidBucketsPerHour = 21,
  kFileNameOutsideLogDirectory = 22,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

}  // namespace logspool

#endif  // LOGSPOOL_STATUS_CODE_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/status_code.hpp>
//

#include <batteries/status.hpp>

namespace logspool {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kFilePatternMissingVersion,
                     "The log file name pattern must contain the ${LOG_VERSION} variable"),  // 1
      CODE_WITH_MSG_(StatusCode::kUnknownFilePatternVariable,
                     "The log file name pattern refers to a variable that is neither built-in nor "
                     "a property of the LogId"),  // 2
      CODE_WITH_MSG_(StatusCode::kNoBufferConfiguration,
                     "No buffer configuration pattern matches the log type"),  // 3
      CODE_WITH_MSG_(StatusCode::kRecordTooLarge,
                     "The record is larger than the payload capacity of its configured buffer "
                     "size"),  // 4
      CODE_WITH_MSG_(StatusCode::kBuffersClosed,
                     "Buffers::put failed; the buffers have been closed"),  // 5
      CODE_WITH_MSG_(StatusCode::kBuffersAlreadyClosed,
                     "Buffers::close was called more than once"),  // 6
      CODE_WITH_MSG_(StatusCode::kTooManyLogVersions,
                     "Could not find a compatible log file version within the rotation bucket; "
                     "the file name pattern probably produces colliding names"),  // 7
      CODE_WITH_MSG_(StatusCode::kLogIdFieldTooLong,
                     "A LogId field is too long to be packed into a buffer header"),  // 8
      CODE_WITH_MSG_(StatusCode::kLogIdHeaderTruncated,
                     "Packed LogId buffer header is (partially) outside the given buffer"),  // 9
      CODE_WITH_MSG_(StatusCode::kCheckpointBadMagic,
                     "Checkpoint header contains bad magic number (is this really a ready queue "
                     "checkpoint?)"),  // 10
      CODE_WITH_MSG_(StatusCode::kCheckpointBadVersion,
                     "Checkpoint format version is not supported"),  // 11
      CODE_WITH_MSG_(StatusCode::kCheckpointTruncated,
                     "Checkpoint file is shorter than its header claims"),  // 12
      CODE_WITH_MSG_(StatusCode::kCheckpointBadCrc,
                     "Checkpoint body crc64 does not match - Possible data corruption"),  // 13
      CODE_WITH_MSG_(StatusCode::kCheckpointBadBufferRecord,
                     "Checkpoint contains an inconsistent buffer record"),  // 14
      CODE_WITH_MSG_(StatusCode::kMetadataParseFailed,
                     "Could not parse log file metadata sidecar"),              // 15
      CODE_WITH_MSG_(StatusCode::kGzipOpenFailed, "Could not open gzip file"),    // 16
      CODE_WITH_MSG_(StatusCode::kGzipWriteFailed, "Could not write gzip file"),  // 17
      CODE_WITH_MSG_(StatusCode::kGzipCloseFailed, "Could not close gzip file"),  // 18
      CODE_WITH_MSG_(StatusCode::kGzipReadFailed, "Could not read gzip file"),    // 19
      CODE_WITH_MSG_(StatusCode::kWriterClosed,
                     "Writer::write failed; the writer has been closed"),  // 20
      CODE_WITH_MSG_(StatusCode::kInvalidBucketsPerHour,
                     "Timestamp buckets per hour must evenly divide 60"),  // 21
      CODE_WITH_MSG_(StatusCode::kFileNameOutsideLogDirectory,
                     "Expanded log file name contains a '..' path component"),  // 22
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

}  // namespace logspool

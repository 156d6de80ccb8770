//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_LOG_METADATA_HPP
#define LOGSPOOL_LOG_METADATA_HPP

#include <logspool/filesystem.hpp>
#include <logspool/status.hpp>

#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace logspool {

/** \brief The identity fields of a log destination, as recorded in the `.metadata.yaml` sidecar
 * next to every Writer output file.
 *
 * The sidecar is only ever compared for equality against the identity of the Writer that wants to
 * append to the file; it is not used to recover data.
 */
struct LogMetadata {
  std::string file_prefix_pattern;
  std::string log_type;
  std::string shard;
  std::string client_hostname;
  std::map<std::string, std::string> properties;

  /** \brief Returns the path of the sidecar file for the log file at `log_file_path`.
   */
  static fs::path path_for(const fs::path& log_file_path);

  /** \brief Parses the sidecar text format produced by `to_yaml()`.
   */
  static StatusOr<LogMetadata> from_yaml(std::string_view text);

  /** \brief Reads the sidecar for `log_file_path`.
   */
  static StatusOr<LogMetadata> read_for_file(const fs::path& log_file_path);

  /** \brief Moves the sidecar of `from_log_file` so that it becomes the sidecar of `to_log_file`.
   * Succeeds without doing anything if `from_log_file` has no sidecar.
   */
  static Status rename_for_file(const fs::path& from_log_file, const fs::path& to_log_file);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  std::string to_yaml() const;

  Status write_for_file(const fs::path& log_file_path) const;
};

bool operator==(const LogMetadata& l, const LogMetadata& r);
bool operator!=(const LogMetadata& l, const LogMetadata& r);

std::ostream& operator<<(std::ostream& out, const LogMetadata& t);

}  // namespace logspool

#endif  // LOGSPOOL_LOG_METADATA_HPP

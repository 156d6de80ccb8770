//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_FILE_ENCODING_HPP
#define LOGSPOOL_FILE_ENCODING_HPP

#include <logspool/filesystem.hpp>
#include <logspool/status.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace logspool {

enum struct FileEncoding {
  kPlain,
  kGzip,
};

std::ostream& operator<<(std::ostream& out, FileEncoding t);

/** \brief Returns kGzip for paths ending in ".gz", kPlain otherwise.
 */
FileEncoding encoding_from_path(const fs::path& path);

/** \brief Receives decoded file contents in order; returns false to stop reading.
 */
using DecodedChunkFn = std::function<bool(std::string_view chunk)>;

/** \brief Decodes the file at `path` and passes its contents to `fn` chunk by chunk.
 *
 * For kGzip, any number of concatenated gzip members is accepted.  The file is structurally
 * invalid (kGzipReadFailed) if it is empty, contains data that does not inflate, or ends in the
 * middle of a member; this is only detected when `fn` does not stop early.
 */
Status read_decoded(const fs::path& path, FileEncoding encoding, const DecodedChunkFn& fn);

/** \brief Returns the whole decoded contents of `path`.
 */
StatusOr<std::string> read_decoded_file(const fs::path& path, FileEncoding encoding);

/** \brief Returns true iff `path` decodes completely under `encoding`.  Plain files are always
 * valid.
 */
StatusOr<bool> is_file_encoding_valid(const fs::path& path, FileEncoding encoding);

/** \brief Returns the first line of the decoded file that is neither blank nor a comment (starts
 * with '#'), with surrounding whitespace removed; None if there is no such line.
 */
StatusOr<Optional<std::string>> read_header_line(const fs::path& path, FileEncoding encoding);

}  // namespace logspool

#endif  // LOGSPOOL_FILE_ENCODING_HPP

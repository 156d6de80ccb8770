//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_OUTPUT_STREAM_HPP
#define LOGSPOOL_OUTPUT_STREAM_HPP

#include <logspool/buffer.hpp>
#include <logspool/file_encoding.hpp>
#include <logspool/filesystem.hpp>
#include <logspool/int_types.hpp>
#include <logspool/status.hpp>

#include <batteries/strong_typedef.hpp>

#include <memory>
#include <string_view>

namespace logspool {

BATT_STRONG_TYPEDEF(bool, OpenForAppend);

/** \brief A buffered, encoding output file.
 */
class OutputStream
{
 public:
  /** \brief Opens `path` for writing with the given encoding.
   *
   * With `open_for_append`, new data is added after any existing content (for gzip, as a new
   * member); otherwise the file is created or truncated.  `buffer_size` is the number of
   * uncompressed bytes buffered in memory before they are written to the file.
   */
  static StatusOr<std::unique_ptr<OutputStream>> open(const fs::path& path, FileEncoding encoding,
                                                      usize buffer_size,
                                                      OpenForAppend open_for_append);

  OutputStream(const OutputStream&) = delete;
  OutputStream& operator=(const OutputStream&) = delete;

  virtual ~OutputStream() = default;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const fs::path& path() const noexcept
  {
    return this->path_;
  }

  // The number of (uncompressed) bytes written through this stream.
  //
  u64 bytes_written() const noexcept
  {
    return this->bytes_written_;
  }

  Status write(const ConstBuffer& bytes);

  Status write(std::string_view s)
  {
    return this->write(as_const_buffer(s));
  }

  virtual Status flush() = 0;

  /** \brief Flushes and closes the file; must be called at most once.
   */
  virtual Status close() = 0;

 protected:
  explicit OutputStream(const fs::path& path) noexcept : path_{path}
  {
  }

  virtual Status write_impl(const ConstBuffer& bytes) = 0;

 private:
  fs::path path_;
  u64 bytes_written_ = 0;
};

}  // namespace logspool

#endif  // LOGSPOOL_OUTPUT_STREAM_HPP

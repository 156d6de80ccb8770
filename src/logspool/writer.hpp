//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_WRITER_HPP
#define LOGSPOOL_WRITER_HPP

#include <logspool/buffer.hpp>
#include <logspool/filesystem.hpp>
#include <logspool/log_id.hpp>
#include <logspool/output_stream.hpp>
#include <logspool/status.hpp>
#include <logspool/timestamp.hpp>
#include <logspool/writer_metrics.hpp>
#include <logspool/writer_options.hpp>

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace logspool {

/** \brief Appends the records of one destination to a file that rotates with the wall clock.
 *
 * The file name is `log_id.file_name(file_pattern, bucket, version)` under the log directory.
 * Every new file starts with the destination's header line and gets a `.metadata.yaml` sidecar.
 * When an existing file for the current bucket has a different header line or sidecar, the version
 * is incremented until a compatible (or missing) file name is found.  An existing file that can
 * not be decoded is moved to `<log_directory>/.corrupted/` and replaced.
 *
 * All methods are thread-safe.  A background thread re-evaluates the rotation bucket every
 * `options.refresh_interval()` so that idle files are closed promptly.
 */
class Writer
{
 public:
  // Receives a human-readable description of a recovered problem (e.g., a corrupted file).
  //
  using ErrorFn = std::function<void(std::string_view message)>;

  /** \brief Returns the metrics shared by all Writers.
   */
  static WriterMetrics& metrics();

  /** \brief Creates a Writer and starts its background refresh thread.
   *
   * Fails with kFilePatternMissingVersion if `file_pattern` does not contain `${LOG_VERSION}`.
   */
  static StatusOr<std::unique_ptr<Writer>> open(
      const fs::path& log_directory, std::string_view file_pattern, const LogId& log_id,
      const WriterOptions& options = WriterOptions::with_default_values());

  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;

  ~Writer() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Appends `bytes` to the file for the current bucket, opening (or creating) it first if
   * necessary.
   *
   * If the write fails, the open file is closed so that the next call starts over.
   */
  Status write(const ConstBuffer& bytes, const ErrorFn& on_error);

  Status write(std::string_view bytes, const ErrorFn& on_error)
  {
    return this->write(as_const_buffer(bytes), on_error);
  }

  /** \brief Closes the current file if the rotation bucket has changed.
   */
  Status refresh();

  /** \brief Stops the background thread and closes the current file.
   */
  Status close();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const fs::path& log_directory() const noexcept
  {
    return this->log_directory_;
  }

  const std::string& file_pattern() const noexcept
  {
    return this->file_pattern_;
  }

  const LogId& log_id() const noexcept
  {
    return this->log_id_;
  }

  /** \brief The path of the file that the next write will go to (given no rotation).
   */
  StatusOr<fs::path> current_file_path() const;

  i32 version() const;

  TimeBucket bucket() const;

  bool is_file_open() const;

 private:
  explicit Writer(const fs::path& log_directory, std::string_view file_pattern,
                  const LogId& log_id, const WriterOptions& options) noexcept;

  void start_refresh_thread();

  void refresh_thread_main();

  StatusOr<fs::path> current_file_path_locked() const;

  Status refresh_locked();

  Status open_output_locked(const ErrorFn& on_error);

  Status create_output_locked(const fs::path& path);

  Status quarantine_locked(const fs::path& path, const ErrorFn& on_error);

  Status close_output_locked();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const fs::path log_directory_;

  const std::string file_pattern_;

  const LogId log_id_;

  const WriterOptions options_;

  mutable std::mutex mutex_;

  std::condition_variable refresh_cond_;

  bool closed_ = false;

  std::unique_ptr<OutputStream> out_;

  TimeBucket bucket_;

  i32 version_ = 1;

  std::thread refresh_thread_;
};

std::ostream& operator<<(std::ostream& out, const Writer& t);

}  // namespace logspool

#endif  // LOGSPOOL_WRITER_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/writer.hpp>
//

#include <logspool/config.hpp>
#include <logspool/file_encoding.hpp>
#include <logspool/log_metadata.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <boost/algorithm/string/trim.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ WriterMetrics& Writer::metrics()
{
  // Intentionally leaked so that Writers closed during static destruction can still update it.
  //
  static WriterMetrics* const metrics_ = [] {
    using batt::Token;

    auto* m = new WriterMetrics;
    m->export_to(global_metric_registry(),
                 MetricLabelSet{
                     MetricLabel{Token{"object_type"}, Token{"logspool_Writer"}},
                 });
    return m;
  }();

  return *metrics_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<Writer>> Writer::open(const fs::path& log_directory,
                                                         std::string_view file_pattern,
                                                         const LogId& log_id,
                                                         const WriterOptions& options)
{
  const std::string version_variable = std::string{"${"} + kLogVersionVariable + "}";

  if (file_pattern.find(version_variable) == std::string_view::npos) {
    LOGSPOOL_LOG_ERROR() << "File name pattern has no " << version_variable << ": "
                         << BATT_INSPECT_STR(file_pattern);
    return {make_status(StatusCode::kFilePatternMissingVersion)};
  }

  std::unique_ptr<Writer> writer{new Writer{log_directory, file_pattern, log_id, options}};

  // Make sure the pattern can be expanded before any data arrives.
  //
  BATT_REQUIRE_OK(writer->current_file_path());

  writer->start_refresh_thread();

  LOGSPOOL_VLOG(1) << "spawning " << *writer;

  return writer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Writer::Writer(const fs::path& log_directory, std::string_view file_pattern, const LogId& log_id,
               const WriterOptions& options) noexcept
    : log_directory_{log_directory}
    , file_pattern_{file_pattern}
    , log_id_{log_id}
    , options_{options}
    , bucket_{options.timestamp().bucket_of(options.now())}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Writer::~Writer() noexcept
{
  bool closed = false;
  {
    std::unique_lock<std::mutex> lock{this->mutex_};
    closed = this->closed_;
  }
  if (!closed) {
    LOGSPOOL_WARN_IF_NOT_OK(this->close());
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Writer::start_refresh_thread()
{
  this->refresh_thread_ = std::thread{[this] {
    this->refresh_thread_main();
  }};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Writer::refresh_thread_main()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  while (!this->closed_) {
    this->refresh_cond_.wait_for(lock, this->options_.refresh_interval(), [this] {
      return this->closed_;
    });
    if (this->closed_) {
      break;
    }

    Status status = this->refresh_locked();
    if (!status.ok()) {
      LOGSPOOL_LOG_WARNING() << "background refresh failed; " << *this << ": " << status;
    }
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::write(const ConstBuffer& bytes, const ErrorFn& on_error)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  if (this->closed_) {
    return make_status(StatusCode::kWriterClosed);
  }

  Status status = [&]() -> Status {
    BATT_REQUIRE_OK(this->refresh_locked());

    if (!this->out_) {
      BATT_REQUIRE_OK(this->open_output_locked(on_error));
    }

    LOGSPOOL_DVLOG(2) << "writing " << bytes.size() << " bytes to " << this->out_->path();

    return this->out_->write(bytes);
  }();

  if (!status.ok()) {
    LOGSPOOL_LOG_ERROR() << "write failed; " << *this << ": " << status;
    if (this->out_) {
      LOGSPOOL_WARN_IF_NOT_OK(this->close_output_locked());
      this->out_ = nullptr;
    }
  }

  return status;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::refresh()
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->refresh_locked();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::refresh_locked()
{
  const TimeBucket current_bucket = this->options_.timestamp().bucket_of(this->options_.now());
  if (current_bucket == this->bucket_) {
    return OkStatus();
  }

  LOGSPOOL_VLOG(1) << "rotating " << *this << " from " << this->bucket_ << " to "
                   << current_bucket;

  Status status = this->close_output_locked();

  this->bucket_ = current_bucket;
  this->version_ = 1;

  return status;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::open_output_locked(const ErrorFn& on_error)
{
  BATT_CHECK_EQ(this->out_, nullptr);

  for (;;) {
    BATT_ASSIGN_OK_RESULT(const fs::path path, this->current_file_path_locked());
    const FileEncoding encoding = encoding_from_path(path);

    BATT_ASSIGN_OK_RESULT(const bool exists, file_exists(path));
    if (!exists) {
      return this->create_output_locked(path);
    }

    BATT_ASSIGN_OK_RESULT(const bool valid, is_file_encoding_valid(path, encoding));
    if (!valid) {
      BATT_REQUIRE_OK(this->quarantine_locked(path, on_error));
      return this->create_output_locked(path);
    }

    BATT_ASSIGN_OK_RESULT(const Optional<std::string> file_headers,
                          read_header_line(path, encoding));

    StatusOr<LogMetadata> file_metadata = LogMetadata::read_for_file(path);
    if (!file_metadata.ok()) {
      LOGSPOOL_VLOG(1) << "no usable metadata for " << path << ": " << file_metadata.status();
    }

    const bool headers_match =
        (file_headers ? *file_headers : std::string{}) == boost::trim_copy(this->log_id_.headers());

    if (headers_match && file_metadata.ok() &&
        *file_metadata == this->log_id_.metadata()) {
      LOGSPOOL_VLOG(1) << "appending to " << path;

      BATT_ASSIGN_OK_RESULT(this->out_,
                            OutputStream::open(path, encoding, this->options_.buffer_size(),
                                               OpenForAppend{true}));
      return OkStatus();
    }

    // The version stays at the cap so later writes in this bucket fail the same way.
    //
    if (this->version_ >= kMaxLogVersion) {
      LOGSPOOL_LOG_ERROR() << "no compatible file version in bucket " << this->bucket_ << " for "
                           << *this;
      return make_status(StatusCode::kTooManyLogVersions);
    }

    this->version_ += 1;
    Writer::metrics().version_bump_count.add(1);

    LOGSPOOL_VLOG(1) << "headers or metadata of " << path << " do not match; trying version "
                     << this->version_;
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::create_output_locked(const fs::path& path)
{
  BATT_REQUIRE_OK(create_parent_directories(path));

  BATT_ASSIGN_OK_RESULT(this->out_,
                        OutputStream::open(path, encoding_from_path(path),
                                           this->options_.buffer_size(), OpenForAppend{false}));

  BATT_REQUIRE_OK(this->log_id_.metadata().write_for_file(path));
  BATT_REQUIRE_OK(this->out_->write(this->log_id_.headers()));
  BATT_REQUIRE_OK(this->out_->write("\n"));

  LOGSPOOL_VLOG(1) << "[" << path << "] write headers " << this->log_id_.headers();

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::quarantine_locked(const fs::path& path, const ErrorFn& on_error)
{
  const std::string message = "corrupted file, cannot append " + path.string();
  if (on_error) {
    on_error(message);
  }
  LOGSPOOL_LOG_ERROR() << message;
  Writer::metrics().corrupted_file_count.add(1);

  const fs::path quarantine_path =
      this->log_directory_ / kCorruptedDirName / path.lexically_relative(this->log_directory_);

  BATT_REQUIRE_OK(move_file(path, quarantine_path)) << BATT_INSPECT(quarantine_path);
  BATT_REQUIRE_OK(LogMetadata::rename_for_file(path, quarantine_path));

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::close_output_locked()
{
  if (!this->out_) {
    return OkStatus();
  }

  std::unique_ptr<OutputStream> out = std::move(this->out_);
  const u64 bytes_written = out->bytes_written();

  LOGSPOOL_VLOG(2) << "closing output " << out->path() << " (" << bytes_written << " bytes)";

  Status status = [&] {
    LatencyTimer timer{Writer::metrics().close_latency};
    return out->close();
  }();

  Writer::metrics().closed_file_count.add(1);
  Writer::metrics().closed_file_bytes.add(bytes_written);

  BATT_REQUIRE_OK(status) << BATT_INSPECT(out->path());

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status Writer::close()
{
  {
    std::unique_lock<std::mutex> lock{this->mutex_};
    if (this->closed_) {
      return OkStatus();
    }
    this->closed_ = true;
  }
  this->refresh_cond_.notify_all();

  if (this->refresh_thread_.joinable()) {
    this->refresh_thread_.join();
  }

  LOGSPOOL_VLOG(1) << "closing " << *this;

  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->close_output_locked();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<fs::path> Writer::current_file_path() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->current_file_path_locked();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<fs::path> Writer::current_file_path_locked() const
{
  BATT_ASSIGN_OK_RESULT(const std::string file_name,
                        this->log_id_.file_name(this->file_pattern_, this->bucket_,
                                                this->version_));

  return this->log_directory_ / file_name;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
i32 Writer::version() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->version_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TimeBucket Writer::bucket() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->bucket_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool Writer::is_file_open() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->out_ != nullptr;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Writer& t)
{
  return out << "Writer{.log_directory=" << t.log_directory()
             << ", .file_pattern=" << batt::c_str_literal(t.file_pattern())
             << ", .log_type=" << batt::c_str_literal(t.log_id().log_type()) << ",}";
}

}  // namespace logspool

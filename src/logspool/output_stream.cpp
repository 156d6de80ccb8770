//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/output_stream.hpp>
//

#include <batteries/assert.hpp>
#include <batteries/checked_cast.hpp>
#include <batteries/stream_util.hpp>

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <string>

namespace logspool {

namespace {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class PlainOutputStream : public OutputStream
{
 public:
  explicit PlainOutputStream(const fs::path& path, int fd, usize buffer_size) noexcept
      : OutputStream{path}
      , fd_{fd}
      , buffer_size_{buffer_size}
  {
    this->buffer_.reserve(buffer_size);
  }

  ~PlainOutputStream() noexcept override
  {
    if (this->fd_ != -1) {
      LOGSPOOL_WARN_IF_NOT_OK(this->close());
    }
  }

  Status flush() override
  {
    if (this->buffer_.empty()) {
      return OkStatus();
    }
    Status status = append_fd(this->fd_, as_const_buffer(this->buffer_));
    this->buffer_.clear();

    return status;
  }

  Status close() override
  {
    BATT_CHECK_NE(this->fd_, -1) << "PlainOutputStream closed twice; " << this->path();

    Status flush_status = this->flush();
    Status close_status = close_fd(this->fd_);
    this->fd_ = -1;

    BATT_REQUIRE_OK(flush_status);
    BATT_REQUIRE_OK(close_status);

    return OkStatus();
  }

 protected:
  Status write_impl(const ConstBuffer& bytes) override
  {
    if (this->buffer_.size() + bytes.size() > this->buffer_size_) {
      BATT_REQUIRE_OK(this->flush());
    }
    if (bytes.size() >= this->buffer_size_) {
      return append_fd(this->fd_, bytes);
    }
    this->buffer_.append(as_str(bytes));

    return OkStatus();
  }

 private:
  int fd_;
  usize buffer_size_;
  std::string buffer_;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class GzipOutputStream : public OutputStream
{
 public:
  explicit GzipOutputStream(const fs::path& path, gzFile file) noexcept
      : OutputStream{path}
      , file_{file}
  {
  }

  ~GzipOutputStream() noexcept override
  {
    if (this->file_ != nullptr) {
      LOGSPOOL_WARN_IF_NOT_OK(this->close());
    }
  }

  Status flush() override
  {
    const int rc = ::gzflush(this->file_, Z_SYNC_FLUSH);
    if (rc != Z_OK) {
      return this->error(StatusCode::kGzipWriteFailed);
    }
    return OkStatus();
  }

  Status close() override
  {
    BATT_CHECK_NOT_NULLPTR(this->file_) << "GzipOutputStream closed twice; " << this->path();

    const int rc = ::gzclose(this->file_);
    this->file_ = nullptr;

    if (rc != Z_OK) {
      LOGSPOOL_LOG_ERROR() << "gzclose failed; " << BATT_INSPECT(rc) << " path=" << this->path();
      if (rc == Z_ERRNO) {
        return batt::status_from_errno(errno);
      }
      return make_status(StatusCode::kGzipCloseFailed);
    }
    return OkStatus();
  }

 protected:
  Status write_impl(const ConstBuffer& bytes) override
  {
    ConstBuffer rest = bytes;
    while (rest.size() > 0) {
      const unsigned chunk_size =
          static_cast<unsigned>(std::min<usize>(rest.size(), usize{1} << 30));

      const int n_written = ::gzwrite(this->file_, rest.data(), chunk_size);
      if (n_written <= 0) {
        return this->error(StatusCode::kGzipWriteFailed);
      }
      rest += n_written;
    }
    return OkStatus();
  }

 private:
  Status error(StatusCode code)
  {
    int errnum = Z_OK;
    const char* message = ::gzerror(this->file_, &errnum);

    LOGSPOOL_LOG_ERROR() << "gzip stream error; " << BATT_INSPECT(errnum)
                         << BATT_INSPECT_STR(std::string_view{message ? message : ""})
                         << " path=" << this->path();
    if (errnum == Z_ERRNO) {
      return batt::status_from_errno(errno);
    }
    return make_status(code);
  }

  gzFile file_;
};

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<OutputStream>> OutputStream::open(
    const fs::path& path, FileEncoding encoding, usize buffer_size, OpenForAppend open_for_append)
{
  switch (encoding) {
    case FileEncoding::kPlain: {
      StatusOr<int> fd = open_for_append ? open_file_for_append(path.string())
                                         : create_file_truncate(path.string());
      BATT_REQUIRE_OK(fd);

      std::unique_ptr<OutputStream> stream =
          std::make_unique<PlainOutputStream>(path, *fd, buffer_size);

      return stream;
    }

    case FileEncoding::kGzip: {
      errno = 0;
      gzFile file = ::gzopen(path.c_str(), open_for_append ? "ab" : "wb");
      if (file == nullptr) {
        LOGSPOOL_LOG_ERROR() << "gzopen failed; path=" << path;
        if (errno != 0) {
          return {batt::status_from_errno(errno)};
        }
        return {make_status(StatusCode::kGzipOpenFailed)};
      }

      if (::gzbuffer(file, BATT_CHECKED_CAST(unsigned, buffer_size)) != 0) {
        LOGSPOOL_LOG_WARNING() << "gzbuffer failed; using the default size;"
                               << BATT_INSPECT(buffer_size);
      }

      std::unique_ptr<OutputStream> stream = std::make_unique<GzipOutputStream>(path, file);

      return stream;
    }
  }

  BATT_PANIC() << "bad FileEncoding: " << static_cast<int>(encoding);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status OutputStream::write(const ConstBuffer& bytes)
{
  BATT_REQUIRE_OK(this->write_impl(bytes));
  this->bytes_written_ += bytes.size();

  return OkStatus();
}

}  // namespace logspool

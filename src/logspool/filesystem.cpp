//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/filesystem.hpp>
//

#include <batteries/finally.hpp>
#include <batteries/stream_util.hpp>
#include <batteries/syscall_retry.hpp>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace logspool {

using ::batt::syscall_retry;

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> open_with_flags(std::string_view file_name, int flags)
{
  const int fd = syscall_retry([&] {
    return ::open(std::string(file_name).c_str(), flags, /*mode=*/0644);
  });
  BATT_REQUIRE_OK(batt::status_from_retval(fd)) << BATT_INSPECT_STR(file_name);

  return fd;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> open_file_read_only(std::string_view file_name)
{
  return open_with_flags(file_name, O_RDONLY | O_CLOEXEC);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> open_file_for_append(std::string_view file_name, CreateIfMissing create_if_missing)
{
  int flags = O_WRONLY | O_APPEND | O_CLOEXEC;
  if (create_if_missing) {
    flags |= O_CREAT;
  }
  return open_with_flags(file_name, flags);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> create_file_truncate(std::string_view file_name)
{
  return open_with_flags(file_name, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ConstBuffer> read_fd(int fd, MutableBuffer buffer, u64 offset)
{
  ConstBuffer contents{buffer.data(), /*size=*/0};
  while (buffer.size() > 0) {
    const auto bytes_read = syscall_retry([&] {
      return ::pread(fd, buffer.data(), buffer.size(), offset + contents.size());
    });
    BATT_REQUIRE_OK(batt::status_from_retval(bytes_read));

    if (bytes_read == 0) {
      break;
    }

    contents = ConstBuffer{contents.data(), contents.size() + bytes_read};
    buffer += bytes_read;
  }

  return contents;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status append_fd(int fd, ConstBuffer buffer)
{
  while (buffer.size() > 0) {
    const auto bytes_written = syscall_retry([&] {
      return ::write(fd, buffer.data(), buffer.size());
    });
    BATT_REQUIRE_OK(batt::status_from_retval(bytes_written));

    if (bytes_written == 0) {
      return batt::StatusCode::kDataLoss;
    }

    buffer += bytes_written;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_fd(int fd, ConstBuffer buffer, u64 offset)
{
  while (buffer.size() > 0) {
    const auto bytes_written = syscall_retry([&] {
      return ::pwrite(fd, buffer.data(), buffer.size(), offset);
    });
    BATT_REQUIRE_OK(batt::status_from_retval(bytes_written));

    if (bytes_written == 0) {
      return batt::StatusCode::kDataLoss;
    }

    buffer += bytes_written;
    offset += bytes_written;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status sync_fd(int fd)
{
  return batt::status_from_retval(syscall_retry([&] {
    return ::fsync(fd);
  }));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status close_fd(int fd)
{
  const int retval = syscall_retry([&] {
    return ::close(fd);
  });
  return batt::status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status delete_file(std::string_view file_name)
{
  return batt::status_from_retval(syscall_retry([&] {
    return ::unlink(std::string(file_name).c_str());
  }));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<i64> sizeof_file(std::string_view file_name)
{
  std::error_code ec;
  const auto size = fs::file_size(fs::path{std::string{file_name}}, ec);
  BATT_REQUIRE_OK(status_from_error_code(ec));

  return static_cast<i64>(size);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> read_file_to_string(std::string_view file_name)
{
  BATT_ASSIGN_OK_RESULT(const int fd, open_file_read_only(file_name));

  auto closer = batt::finally([fd] {
    LOGSPOOL_WARN_IF_NOT_OK(close_fd(fd));
  });

  std::string contents;
  u64 offset = 0;
  for (;;) {
    contents.resize(offset + kFileScanChunkSize);

    BATT_ASSIGN_OK_RESULT(
        ConstBuffer chunk,
        read_fd(fd, MutableBuffer{contents.data() + offset, kFileScanChunkSize}, offset));

    offset += chunk.size();
    if (chunk.size() < kFileScanChunkSize) {
      break;
    }
  }
  contents.resize(offset);

  return contents;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_file(std::string_view file_name, ConstBuffer data)
{
  BATT_ASSIGN_OK_RESULT(const int fd, create_file_truncate(file_name));

  Status write_status = [&]() -> Status {
    BATT_REQUIRE_OK(write_fd(fd, data, /*offset=*/0));
    BATT_REQUIRE_OK(sync_fd(fd));
    return OkStatus();
  }();

  Status close_status = close_fd(fd);

  BATT_REQUIRE_OK(write_status) << BATT_INSPECT_STR(file_name);
  BATT_REQUIRE_OK(close_status) << BATT_INSPECT_STR(file_name);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> file_exists(const fs::path& path)
{
  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  BATT_REQUIRE_OK(status_from_error_code(ec));

  return exists;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status create_parent_directories(const fs::path& path)
{
  const fs::path parent = path.parent_path();
  if (parent.empty()) {
    return OkStatus();
  }

  std::error_code ec;
  fs::create_directories(parent, ec);

  return status_from_error_code(ec);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status move_file(const fs::path& from, const fs::path& to)
{
  BATT_REQUIRE_OK(create_parent_directories(to));

  std::error_code ec;
  fs::rename(from, to, ec);

  return status_from_error_code(ec);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status status_from_error_code(const std::error_code& ec)
{
  if (!ec) {
    return OkStatus();
  }
  return batt::status_from_errno(ec.value());
}

}  // namespace logspool

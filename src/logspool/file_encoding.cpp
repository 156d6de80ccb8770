//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/file_encoding.hpp>
//

#include <logspool/config.hpp>

#include <batteries/finally.hpp>
#include <batteries/stream_util.hpp>

#include <zlib.h>

#include <cstring>
#include <vector>

namespace logspool {

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status read_plain(int fd, const DecodedChunkFn& fn)
{
  std::vector<char> chunk(kFileScanChunkSize);
  u64 offset = 0;
  for (;;) {
    BATT_ASSIGN_OK_RESULT(ConstBuffer data,
                          read_fd(fd, MutableBuffer{chunk.data(), chunk.size()}, offset));
    if (data.size() == 0) {
      break;
    }
    offset += data.size();
    if (!fn(as_str(data))) {
      break;
    }
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status read_gzip(int fd, const DecodedChunkFn& fn)
{
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));

  // 16 + MAX_WBITS: expect a gzip wrapper rather than raw zlib.
  //
  if (::inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
    return make_status(StatusCode::kGzipReadFailed);
  }
  auto on_scope_exit = batt::finally([&zs] {
    ::inflateEnd(&zs);
  });

  std::vector<char> input(kFileScanChunkSize);
  std::vector<char> output(kFileScanChunkSize);

  u64 offset = 0;
  bool saw_input = false;
  bool member_open = false;
  bool need_reset = false;

  for (;;) {
    BATT_ASSIGN_OK_RESULT(ConstBuffer data,
                          read_fd(fd, MutableBuffer{input.data(), input.size()}, offset));
    if (data.size() == 0) {
      break;
    }
    offset += data.size();
    saw_input = true;

    zs.next_in = reinterpret_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(data.size());

    for (;;) {
      if (zs.avail_in > 0 && !member_open) {
        if (need_reset) {
          ::inflateReset(&zs);
          need_reset = false;
        }
        member_open = true;
      }

      zs.next_out = reinterpret_cast<Bytef*>(output.data());
      zs.avail_out = static_cast<uInt>(output.size());

      const int rc = ::inflate(&zs, Z_NO_FLUSH);
      const usize produced = output.size() - zs.avail_out;

      if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
        LOGSPOOL_VLOG(1) << "inflate failed; " << BATT_INSPECT(rc) << BATT_INSPECT(offset);
        return make_status(StatusCode::kGzipReadFailed);
      }

      if (produced > 0 && !fn(std::string_view{output.data(), produced})) {
        return OkStatus();
      }

      if (rc == Z_STREAM_END) {
        member_open = false;
        need_reset = true;
        if (zs.avail_in == 0) {
          break;
        }
        continue;
      }

      if (rc == Z_BUF_ERROR || (zs.avail_in == 0 && zs.avail_out != 0)) {
        break;
      }
    }
  }

  if (!saw_input || member_open) {
    return make_status(StatusCode::kGzipReadFailed);
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string_view trim(std::string_view s)
{
  while (!s.empty() && static_cast<unsigned char>(s.front()) <= ' ') {
    s.remove_prefix(1);
  }
  while (!s.empty() && static_cast<unsigned char>(s.back()) <= ' ') {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, FileEncoding t)
{
  switch (t) {
    case FileEncoding::kPlain:
      return out << "plain";
    case FileEncoding::kGzip:
      return out << "gzip";
  }
  return out << "(bad FileEncoding: " << static_cast<int>(t) << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
FileEncoding encoding_from_path(const fs::path& path)
{
  if (path.extension() == ".gz") {
    return FileEncoding::kGzip;
  }
  return FileEncoding::kPlain;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status read_decoded(const fs::path& path, FileEncoding encoding, const DecodedChunkFn& fn)
{
  BATT_ASSIGN_OK_RESULT(const int fd, open_file_read_only(path.string()));

  auto closer = batt::finally([fd] {
    LOGSPOOL_WARN_IF_NOT_OK(close_fd(fd));
  });

  switch (encoding) {
    case FileEncoding::kPlain:
      return read_plain(fd, fn);

    case FileEncoding::kGzip:
      return read_gzip(fd, fn);
  }

  BATT_PANIC() << "bad FileEncoding: " << static_cast<int>(encoding);
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> read_decoded_file(const fs::path& path, FileEncoding encoding)
{
  std::string contents;

  BATT_REQUIRE_OK(read_decoded(path, encoding, [&contents](std::string_view chunk) {
    contents.append(chunk);
    return true;
  }));

  return contents;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> is_file_encoding_valid(const fs::path& path, FileEncoding encoding)
{
  if (encoding == FileEncoding::kPlain) {
    return true;
  }

  Status status = read_decoded(path, encoding, [](std::string_view) {
    return true;
  });

  if (status == make_status(StatusCode::kGzipReadFailed)) {
    return false;
  }
  BATT_REQUIRE_OK(status);

  return true;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Optional<std::string>> read_header_line(const fs::path& path, FileEncoding encoding)
{
  Optional<std::string> header;
  std::string line;

  const auto consider_line = [&header](std::string_view raw_line) {
    const std::string_view trimmed = trim(raw_line);
    if (trimmed.empty() || trimmed.front() == '#') {
      return false;
    }
    header.emplace(trimmed);
    return true;
  };

  BATT_REQUIRE_OK(read_decoded(path, encoding, [&](std::string_view chunk) {
    while (!chunk.empty()) {
      const usize eol = chunk.find('\n');
      if (eol == std::string_view::npos) {
        line.append(chunk);
        return true;
      }
      line.append(chunk.substr(0, eol));
      chunk.remove_prefix(eol + 1);
      if (consider_line(line)) {
        return false;
      }
      line.clear();
    }
    return true;
  }));

  if (!header && !line.empty()) {
    consider_line(line);
  }

  return header;
}

}  // namespace logspool

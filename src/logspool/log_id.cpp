//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/log_id.hpp>
//

#include <logspool/config.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <cstring>
#include <tuple>

namespace logspool {

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void append_length_prefixed(std::string& out, std::string_view s)
{
  out += std::to_string(s.size());
  out += ':';
  out += s;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename PackedIntT>
void append_packed(std::string& out, PackedIntT value)
{
  out.append(reinterpret_cast<const char*>(&value), sizeof(value));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status append_packed_str(std::string& out, std::string_view s)
{
  if (s.size() > LogId::kMaxPackedStringSize) {
    return make_status(StatusCode::kLogIdFieldTooLong);
  }
  append_packed(out, big_u16(static_cast<u16>(s.size())));
  out.append(s);

  return OkStatus();
}

/** \brief Reads big-endian fields from the front of a buffer.
 */
class PackedHeaderReader
{
 public:
  explicit PackedHeaderReader(const ConstBuffer& src) noexcept : src_{src}
  {
  }

  template <typename PackedIntT>
  StatusOr<PackedIntT> read()
  {
    if (this->src_.size() < sizeof(PackedIntT)) {
      return {make_status(StatusCode::kLogIdHeaderTruncated)};
    }
    PackedIntT value;
    std::memcpy(&value, this->src_.data(), sizeof(PackedIntT));
    this->consume(sizeof(PackedIntT));
    return value;
  }

  StatusOr<std::string> read_str()
  {
    BATT_ASSIGN_OK_RESULT(const big_u16 packed_size, this->read<big_u16>());
    const usize size = packed_size;
    if (this->src_.size() < size) {
      return {make_status(StatusCode::kLogIdHeaderTruncated)};
    }
    std::string s{static_cast<const char*>(this->src_.data()), size};
    this->consume(size);
    return s;
  }

  usize bytes_consumed() const noexcept
  {
    return this->consumed_;
  }

 private:
  void consume(usize n)
  {
    this->src_ += n;
    this->consumed_ += n;
  }

  ConstBuffer src_;
  usize consumed_ = 0;
};

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
LogId::LogId(std::string file_prefix_pattern, std::string log_type, std::string client_hostname,
             i32 shard, PropertyMap properties, std::string headers) noexcept
    : file_prefix_pattern_{std::move(file_prefix_pattern)}
    , log_type_{std::move(log_type)}
    , client_hostname_{std::move(client_hostname)}
    , shard_{shard}
    , properties_{std::move(properties)}
    , headers_{std::move(headers)}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string LogId::lock_key() const
{
  std::string key;

  append_length_prefixed(key, this->file_prefix_pattern_);
  append_length_prefixed(key, this->log_type_);
  append_length_prefixed(key, this->client_hostname_);
  append_length_prefixed(key, std::to_string(this->shard_));

  key += std::to_string(this->properties_.size());
  key += '#';
  for (const auto& [name, value] : this->properties_) {
    append_length_prefixed(key, name);
    append_length_prefixed(key, value);
  }

  append_length_prefixed(key, this->headers_);

  return key;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> LogId::file_name(std::string_view file_pattern, const TimeBucket& bucket,
                                       i32 version) const
{
  const auto lookup = [&](std::string_view name) -> Optional<std::string> {
    if (name == "LOG_TYPE") {
      return this->log_type_;
    }
    if (name == kLogVersionVariable) {
      return std::to_string(version);
    }
    if (name == "CLIENT_HOST") {
      return this->client_hostname_;
    }
    if (name == "SHARD") {
      return std::to_string(this->shard_);
    }
    if (name == "YEAR") {
      return zero_pad(bucket.year, 4);
    }
    if (name == "MONTH") {
      return zero_pad(bucket.month, 2);
    }
    if (name == "DAY") {
      return zero_pad(bucket.day, 2);
    }
    if (name == "HOUR") {
      return zero_pad(bucket.hour, 2);
    }
    if (name == "MINUTE") {
      return zero_pad(bucket.minute, 2);
    }
    if (name == "INTERVAL") {
      return bucket.interval_str();
    }
    auto iter = this->properties_.find(std::string{name});
    if (iter != this->properties_.end()) {
      return iter->second;
    }
    return None;
  };

  std::string pattern;
  if (!this->file_prefix_pattern_.empty()) {
    pattern = this->file_prefix_pattern_;
    while (!pattern.empty() && pattern.back() == '/') {
      pattern.pop_back();
    }
    pattern += '/';
  }
  pattern += file_pattern;

  std::string result;
  std::string_view rest = pattern;
  for (;;) {
    const usize start = rest.find("${");
    if (start == std::string_view::npos) {
      result += rest;
      break;
    }
    const usize end = rest.find('}', start + 2);
    if (end == std::string_view::npos) {
      result += rest;
      break;
    }

    result += rest.substr(0, start);

    const std::string_view name = rest.substr(start + 2, end - (start + 2));
    Optional<std::string> value = lookup(name);
    if (!value) {
      LOGSPOOL_LOG_ERROR() << "Unknown variable in file name pattern: " << BATT_INSPECT_STR(name)
                           << BATT_INSPECT_STR(file_pattern) << " log_id=" << *this;
      return {make_status(StatusCode::kUnknownFilePatternVariable)};
    }
    result += *value;

    rest = rest.substr(end + 1);
  }

  const usize first_non_slash = result.find_first_not_of('/');
  if (first_non_slash == std::string::npos) {
    result.clear();
  } else {
    result.erase(0, first_non_slash);
  }

  std::string_view components = result;
  while (!components.empty()) {
    const usize slash = components.find('/');
    if (components.substr(0, slash) == "..") {
      LOGSPOOL_LOG_ERROR() << "File name leaves the log directory: " << BATT_INSPECT_STR(result)
                           << BATT_INSPECT_STR(file_pattern) << " log_id=" << *this;
      return {make_status(StatusCode::kFileNameOutsideLogDirectory)};
    }
    if (slash == std::string_view::npos) {
      break;
    }
    components.remove_prefix(slash + 1);
  }

  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
LogMetadata LogId::metadata() const
{
  LogMetadata m;

  m.file_prefix_pattern = this->file_prefix_pattern_;
  m.log_type = this->log_type_;
  m.shard = std::to_string(this->shard_);
  m.client_hostname = this->client_hostname_;
  m.properties = this->properties_;

  return m;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize LogId::packed_header_size() const
{
  usize size = kPackedIdSize                                                  //
               + sizeof(big_u16) + this->file_prefix_pattern_.size()          //
               + sizeof(big_u16) + this->log_type_.size()                     //
               + sizeof(big_u16) + this->client_hostname_.size()              //
               + sizeof(big_i32)                                              //
               + sizeof(big_u16)                                              //
               + sizeof(big_u16) + this->headers_.size();

  for (const auto& [name, value] : this->properties_) {
    size += sizeof(big_u16) + name.size() + sizeof(big_u16) + value.size();
  }

  return size;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::string> LogId::pack_header(u64 buffer_id) const
{
  if (this->properties_.size() > kMaxPackedStringSize) {
    return {make_status(StatusCode::kLogIdFieldTooLong)};
  }

  std::string out;
  out.reserve(this->packed_header_size());

  append_packed(out, big_u64(buffer_id));
  BATT_REQUIRE_OK(append_packed_str(out, this->file_prefix_pattern_));
  BATT_REQUIRE_OK(append_packed_str(out, this->log_type_));
  BATT_REQUIRE_OK(append_packed_str(out, this->client_hostname_));
  append_packed(out, big_i32(this->shard_));
  append_packed(out, big_u16(static_cast<u16>(this->properties_.size())));
  for (const auto& [name, value] : this->properties_) {
    BATT_REQUIRE_OK(append_packed_str(out, name));
    BATT_REQUIRE_OK(append_packed_str(out, value));
  }
  BATT_REQUIRE_OK(append_packed_str(out, this->headers_));

  BATT_CHECK_EQ(out.size(), this->packed_header_size());

  return out;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LogId::stamp_header_id(MutableBuffer packed_header, u64 buffer_id)
{
  BATT_CHECK_GE(packed_header.size(), kPackedIdSize);

  const big_u64 packed_id = buffer_id;
  std::memcpy(packed_header.data(), &packed_id, sizeof(packed_id));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<UnpackedBufferHeader> LogId::unpack_header(const ConstBuffer& packed)
{
  PackedHeaderReader reader{packed};

  BATT_ASSIGN_OK_RESULT(const big_u64 buffer_id, reader.read<big_u64>());
  BATT_ASSIGN_OK_RESULT(std::string file_prefix_pattern, reader.read_str());
  BATT_ASSIGN_OK_RESULT(std::string log_type, reader.read_str());
  BATT_ASSIGN_OK_RESULT(std::string client_hostname, reader.read_str());
  BATT_ASSIGN_OK_RESULT(const big_i32 shard, reader.read<big_i32>());
  BATT_ASSIGN_OK_RESULT(const big_u16 property_count, reader.read<big_u16>());

  PropertyMap properties;
  for (usize i = 0; i < property_count; ++i) {
    BATT_ASSIGN_OK_RESULT(std::string name, reader.read_str());
    BATT_ASSIGN_OK_RESULT(std::string value, reader.read_str());
    properties.emplace(std::move(name), std::move(value));
  }

  BATT_ASSIGN_OK_RESULT(std::string headers, reader.read_str());

  return UnpackedBufferHeader{
      .buffer_id = buffer_id,
      .log_id = LogId{std::move(file_prefix_pattern), std::move(log_type),
                      std::move(client_hostname), shard, std::move(properties),
                      std::move(headers)},
      .header_length = reader.bytes_consumed(),
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator==(const LogId& l, const LogId& r)
{
  return l.shard() == r.shard()                              //
         && l.log_type() == r.log_type()                     //
         && l.client_hostname() == r.client_hostname()       //
         && l.file_prefix_pattern() == r.file_prefix_pattern()  //
         && l.properties() == r.properties()                 //
         && l.headers() == r.headers();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator!=(const LogId& l, const LogId& r)
{
  return !(l == r);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const LogId& t)
{
  out << "LogId{.file_prefix_pattern=" << batt::c_str_literal(t.file_prefix_pattern())
      << ", .log_type=" << batt::c_str_literal(t.log_type())
      << ", .client_hostname=" << batt::c_str_literal(t.client_hostname())
      << ", .shard=" << t.shard() << ", .properties={";
  for (const auto& [name, value] : t.properties()) {
    out << name << ": " << batt::c_str_literal(value) << ", ";
  }
  return out << "}, .headers=" << batt::c_str_literal(t.headers()) << ",}";
}

}  // namespace logspool

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/log_metadata.hpp>
//

#include <logspool/config.hpp>

#include <batteries/stream_util.hpp>

#include <tuple>
#include <vector>

namespace logspool {

namespace {

constexpr std::string_view kDocumentStart = "---";

constexpr std::string_view kFilePrefixPatternKey = "filePrefixPattern";
constexpr std::string_view kTypeKey = "type";
constexpr std::string_view kShardKey = "shard";
constexpr std::string_view kClientHostnameKey = "clientHostname";

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void append_entry(std::string& out, std::string_view key, std::string_view value)
{
  out.append(key);
  out.append(": \"");
  for (char ch : value) {
    switch (ch) {
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '"':
      case '\\':
        out.push_back('\\');
        [[fallthrough]];
      default:
        out.push_back(ch);
        break;
    }
  }
  out.append("\"\n");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
// Parses one `key: "value"` line.
//
StatusOr<std::pair<std::string, std::string>> parse_entry(std::string_view line)
{
  const usize colon = line.find(": \"");
  if (colon == std::string_view::npos || colon == 0 || line.back() != '"' ||
      line.size() < colon + 4) {
    return {make_status(StatusCode::kMetadataParseFailed)};
  }

  std::pair<std::string, std::string> entry;
  entry.first = std::string{line.substr(0, colon)};

  const std::string_view quoted = line.substr(colon + 3, line.size() - colon - 4);
  bool escaped = false;
  for (char ch : quoted) {
    if (escaped) {
      entry.second.push_back(ch == 'n' ? '\n' : (ch == 'r' ? '\r' : ch));
      escaped = false;
    } else if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return {make_status(StatusCode::kMetadataParseFailed)};
    } else {
      entry.second.push_back(ch);
    }
  }
  if (escaped) {
    return {make_status(StatusCode::kMetadataParseFailed)};
  }

  return entry;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
fs::path LogMetadata::path_for(const fs::path& log_file_path)
{
  fs::path result = log_file_path;
  result += kMetadataFileSuffix;
  return result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<LogMetadata> LogMetadata::from_yaml(std::string_view text)
{
  std::vector<std::string_view> lines;
  while (!text.empty()) {
    const usize eol = text.find('\n');
    std::string_view line = text.substr(0, eol);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      lines.emplace_back(line);
    }
    if (eol == std::string_view::npos) {
      break;
    }
    text.remove_prefix(eol + 1);
  }

  if (lines.size() < 5 || lines[0] != kDocumentStart) {
    return {make_status(StatusCode::kMetadataParseFailed)};
  }

  LogMetadata metadata;

  const std::pair<std::string_view, std::string*> fixed_fields[] = {
      {kFilePrefixPatternKey, &metadata.file_prefix_pattern},
      {kTypeKey, &metadata.log_type},
      {kShardKey, &metadata.shard},
      {kClientHostnameKey, &metadata.client_hostname},
  };

  usize i = 1;
  for (const auto& [key, dst] : fixed_fields) {
    BATT_ASSIGN_OK_RESULT(auto entry, parse_entry(lines[i]));
    if (entry.first != key) {
      return {make_status(StatusCode::kMetadataParseFailed)};
    }
    *dst = std::move(entry.second);
    ++i;
  }

  for (; i < lines.size(); ++i) {
    BATT_ASSIGN_OK_RESULT(auto entry, parse_entry(lines[i]));
    const bool inserted = metadata.properties.emplace(std::move(entry)).second;
    if (!inserted) {
      return {make_status(StatusCode::kMetadataParseFailed)};
    }
  }

  return metadata;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<LogMetadata> LogMetadata::read_for_file(const fs::path& log_file_path)
{
  BATT_ASSIGN_OK_RESULT(std::string text,
                        read_file_to_string(LogMetadata::path_for(log_file_path).string()));

  return LogMetadata::from_yaml(text);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status LogMetadata::rename_for_file(const fs::path& from_log_file, const fs::path& to_log_file)
{
  const fs::path from = LogMetadata::path_for(from_log_file);

  BATT_ASSIGN_OK_RESULT(const bool exists, file_exists(from));
  if (!exists) {
    return OkStatus();
  }

  return move_file(from, LogMetadata::path_for(to_log_file));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string LogMetadata::to_yaml() const
{
  std::string out{kDocumentStart};
  out.push_back('\n');

  append_entry(out, kFilePrefixPatternKey, this->file_prefix_pattern);
  append_entry(out, kTypeKey, this->log_type);
  append_entry(out, kShardKey, this->shard);
  append_entry(out, kClientHostnameKey, this->client_hostname);

  for (const auto& [key, value] : this->properties) {
    append_entry(out, key, value);
  }

  return out;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status LogMetadata::write_for_file(const fs::path& log_file_path) const
{
  const std::string yaml = this->to_yaml();

  return write_file(LogMetadata::path_for(log_file_path).string(), as_const_buffer(yaml));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator==(const LogMetadata& l, const LogMetadata& r)
{
  return std::tie(l.file_prefix_pattern, l.log_type, l.shard, l.client_hostname, l.properties) ==
         std::tie(r.file_prefix_pattern, r.log_type, r.shard, r.client_hostname, r.properties);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator!=(const LogMetadata& l, const LogMetadata& r)
{
  return !(l == r);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const LogMetadata& t)
{
  out << "LogMetadata{.file_prefix_pattern=" << batt::c_str_literal(t.file_prefix_pattern)
      << ", .log_type=" << batt::c_str_literal(t.log_type)
      << ", .shard=" << batt::c_str_literal(t.shard)
      << ", .client_hostname=" << batt::c_str_literal(t.client_hostname) << ", .properties={";
  for (const auto& [key, value] : t.properties) {
    out << key << ": " << batt::c_str_literal(value) << ", ";
  }
  return out << "},}";
}

}  // namespace logspool

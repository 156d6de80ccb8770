//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/checkpoint.hpp>
//

#include <logspool/crc.hpp>

#include <batteries/checked_cast.hpp>
#include <batteries/stream_util.hpp>

#include <cstring>

namespace logspool {

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename T>
void append_struct(std::string& out, const T& value)
{
  out.append(reinterpret_cast<const char*>(&value), sizeof(T));
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string pack_checkpoint(const ReadyQueue& queue)
{
  std::string packed(sizeof(PackedCheckpointHeader), '\0');
  u64 buffer_count = 0;

  queue.visit([&](const LogBuffer& buffer) {
    const ConstBuffer data = buffer.data();

    PackedCheckpointBufferRecord record;
    std::memset(&record, 0, sizeof(record));
    record.id = buffer.id();
    record.capacity = BATT_CHECKED_CAST(u32, buffer.capacity());
    record.header_length = BATT_CHECKED_CAST(u32, buffer.header_length());
    record.data_size = BATT_CHECKED_CAST(u32, data.size());

    append_struct(packed, record);
    packed.append(as_str(data));
    ++buffer_count;
  });

  const ConstBuffer body{packed.data() + sizeof(PackedCheckpointHeader),
                         packed.size() - sizeof(PackedCheckpointHeader)};

  PackedCheckpointHeader header;
  std::memset(&header, 0, sizeof(header));
  header.magic = PackedCheckpointHeader::kMagic;
  header.format_version = PackedCheckpointHeader::kCurrentVersion;
  header.buffer_count = buffer_count;
  header.body_size = body.size();
  header.body_crc64 = crc64_of(body);

  std::memcpy(packed.data(), &header, sizeof(header));

  return packed;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<std::unique_ptr<LogBuffer>>> unpack_checkpoint(const ConstBuffer& packed)
{
  if (packed.size() < sizeof(PackedCheckpointHeader)) {
    return {make_status(StatusCode::kCheckpointTruncated)};
  }

  PackedCheckpointHeader header;
  std::memcpy(&header, packed.data(), sizeof(header));

  if (header.magic != PackedCheckpointHeader::kMagic) {
    return {make_status(StatusCode::kCheckpointBadMagic)};
  }
  if (header.format_version != PackedCheckpointHeader::kCurrentVersion) {
    LOGSPOOL_LOG_WARNING() << "Unsupported checkpoint format; "
                           << BATT_INSPECT(header.format_version);
    return {make_status(StatusCode::kCheckpointBadVersion)};
  }

  ConstBuffer body = packed + sizeof(PackedCheckpointHeader);
  if (body.size() != header.body_size) {
    LOGSPOOL_LOG_WARNING() << "Checkpoint size mismatch; " << BATT_INSPECT(body.size())
                           << BATT_INSPECT(header.body_size);
    return {make_status(StatusCode::kCheckpointTruncated)};
  }
  if (crc64_of(body) != header.body_crc64) {
    return {make_status(StatusCode::kCheckpointBadCrc)};
  }

  // Every record occupies at least its fixed-size prefix.
  //
  if (header.buffer_count > body.size() / sizeof(PackedCheckpointBufferRecord)) {
    LOGSPOOL_LOG_WARNING() << "Checkpoint buffer count exceeds its body; "
                           << BATT_INSPECT(header.buffer_count) << BATT_INSPECT(body.size());
    return {make_status(StatusCode::kCheckpointBadBufferRecord)};
  }

  std::vector<std::unique_ptr<LogBuffer>> buffers;
  buffers.reserve(header.buffer_count);

  for (u64 i = 0; i < header.buffer_count; ++i) {
    if (body.size() < sizeof(PackedCheckpointBufferRecord)) {
      return {make_status(StatusCode::kCheckpointBadBufferRecord)};
    }

    PackedCheckpointBufferRecord record;
    std::memcpy(&record, body.data(), sizeof(record));
    body += sizeof(PackedCheckpointBufferRecord);

    if (body.size() < record.data_size || record.header_length > record.data_size) {
      return {make_status(StatusCode::kCheckpointBadBufferRecord)};
    }

    BATT_ASSIGN_OK_RESULT(
        std::unique_ptr<LogBuffer> buffer,
        LogBuffer::restore_closed(record.capacity, ConstBuffer{body.data(), record.data_size}));

    if (buffer->id() != record.id || buffer->header_length() != record.header_length) {
      LOGSPOOL_LOG_WARNING() << "Checkpoint record does not match its buffer header; "
                             << BATT_INSPECT(record.id) << BATT_INSPECT(buffer->id());
      return {make_status(StatusCode::kCheckpointBadBufferRecord)};
    }

    body += record.data_size;
    buffers.emplace_back(std::move(buffer));
  }

  if (body.size() != 0) {
    return {make_status(StatusCode::kCheckpointBadBufferRecord)};
  }

  return buffers;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status save_checkpoint(const fs::path& path, const ReadyQueue& queue)
{
  const std::string packed = pack_checkpoint(queue);

  fs::path temp_path = path;
  temp_path += ".tmp";

  BATT_REQUIRE_OK(create_parent_directories(path));
  BATT_REQUIRE_OK(write_file(temp_path.string(), as_const_buffer(packed)));
  BATT_REQUIRE_OK(move_file(temp_path, path)) << BATT_INSPECT(path);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<std::unique_ptr<LogBuffer>>> load_checkpoint(const fs::path& path)
{
  BATT_ASSIGN_OK_RESULT(const std::string packed, read_file_to_string(path.string()));

  return unpack_checkpoint(as_const_buffer(packed));
}

}  // namespace logspool

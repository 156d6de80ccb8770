//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/log_buffer.hpp>
//

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <cstring>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<LogBuffer>> LogBuffer::make_new(const LogId& log_id,
                                                                    usize capacity)
{
  std::unique_ptr<LogBuffer> buffer{new LogBuffer{capacity}};
  BATT_REQUIRE_OK(buffer->reset(log_id));

  return buffer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<std::unique_ptr<LogBuffer>> LogBuffer::restore_closed(usize capacity,
                                                                          const ConstBuffer& data)
{
  if (data.size() > capacity) {
    return {make_status(StatusCode::kCheckpointBadBufferRecord)};
  }

  BATT_ASSIGN_OK_RESULT(UnpackedBufferHeader header, LogId::unpack_header(data));

  std::unique_ptr<LogBuffer> buffer{new LogBuffer{capacity}};

  std::memcpy(buffer->storage_.get(), data.data(), data.size());
  buffer->header_length_ = header.header_length;
  buffer->payload_size_ = data.size() - header.header_length;
  buffer->closed_ = true;
  buffer->id_ = header.buffer_id;
  buffer->log_id_ = std::move(header.log_id);

  return buffer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
LogBuffer::LogBuffer(usize capacity) noexcept
    : capacity_{capacity}
    , storage_{new char[capacity]}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LogBuffer::append(const ConstBuffer& bytes)
{
  BATT_CHECK(!this->closed_) << "append to a closed LogBuffer; id=" << this->id_;
  BATT_CHECK(this->available(bytes.size()))
      << BATT_INSPECT(bytes.size()) << BATT_INSPECT(this->space());

  std::memcpy(this->storage_.get() + this->header_length_ + this->payload_size_, bytes.data(),
              bytes.size());
  this->payload_size_ += bytes.size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void LogBuffer::close(u64 id)
{
  BATT_CHECK(!this->closed_) << "LogBuffer closed twice; id=" << this->id_
                             << BATT_INSPECT(id);

  LogId::stamp_header_id(MutableBuffer{this->storage_.get(), this->header_length_}, id);
  this->id_ = id;
  this->closed_ = true;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status LogBuffer::reset(const LogId& log_id)
{
  BATT_ASSIGN_OK_RESULT(std::string header, log_id.pack_header(kUnassignedId));

  if (header.size() > this->capacity_) {
    LOGSPOOL_LOG_ERROR() << "LogBuffer header does not fit; " << BATT_INSPECT(header.size())
                         << BATT_INSPECT(this->capacity_) << " log_id=" << log_id;
    return make_status(StatusCode::kRecordTooLarge);
  }

  std::memcpy(this->storage_.get(), header.data(), header.size());
  this->header_length_ = header.size();
  this->payload_size_ = 0;
  this->closed_ = false;
  this->id_ = kUnassignedId;
  this->log_id_ = log_id;

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const LogBuffer& t)
{
  return out << "LogBuffer{.id=" << t.id() << ", .capacity=" << t.capacity()
             << ", .header_length=" << t.header_length() << ", .payload_size=" << t.payload_size()
             << ", .closed=" << t.is_closed() << ", .log_type=" << t.log_id().log_type() << ",}";
}

}  // namespace logspool

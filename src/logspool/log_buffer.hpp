//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_LOG_BUFFER_HPP
#define LOGSPOOL_LOG_BUFFER_HPP

#include <logspool/buffer.hpp>
#include <logspool/int_types.hpp>
#include <logspool/log_id.hpp>
#include <logspool/status.hpp>

#include <memory>
#include <ostream>

namespace logspool {

/** \brief A fixed-capacity byte region that batches the records of one destination.
 *
 * The first `header_length()` bytes are the packed identity of the destination (see
 * LogId::pack_header); the rest is the payload, filled by `append` until it is full or the buffer
 * is closed.  A closed buffer is immutable until it is `reset` for another owner.
 *
 * LogBuffer is not thread-safe; at any time it is owned (via std::unique_ptr) by exactly one of:
 * the current-buffer slot of a destination, the ready queue, or the buffer cache.
 */
class LogBuffer
{
 public:
  static constexpr u64 kUnassignedId = 0;

  /** \brief Allocates a new, empty buffer of `capacity` bytes for `log_id`.
   *
   * Fails with kRecordTooLarge if the packed header alone does not fit in `capacity`.
   */
  static StatusOr<std::unique_ptr<LogBuffer>> make_new(const LogId& log_id, usize capacity);

  /** \brief Rebuilds a closed buffer from its checkpointed bytes (header + payload).
   */
  static StatusOr<std::unique_ptr<LogBuffer>> restore_closed(usize capacity,
                                                              const ConstBuffer& data);

  LogBuffer(const LogBuffer&) = delete;
  LogBuffer& operator=(const LogBuffer&) = delete;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize capacity() const noexcept
  {
    return this->capacity_;
  }

  usize header_length() const noexcept
  {
    return this->header_length_;
  }

  usize payload_size() const noexcept
  {
    return this->payload_size_;
  }

  // The largest payload this buffer can ever hold.
  //
  usize payload_capacity() const noexcept
  {
    return this->capacity_ - this->header_length_;
  }

  usize space() const noexcept
  {
    return this->payload_capacity() - this->payload_size_;
  }

  bool available(usize n) const noexcept
  {
    return n <= this->space();
  }

  bool is_empty() const noexcept
  {
    return this->payload_size_ == 0;
  }

  bool is_closed() const noexcept
  {
    return this->closed_;
  }

  u64 id() const noexcept
  {
    return this->id_;
  }

  const LogId& log_id() const noexcept
  {
    return this->log_id_;
  }

  /** \brief Header + payload; the bytes a shipper sends.
   */
  ConstBuffer data() const noexcept
  {
    return ConstBuffer{this->storage_.get(), this->header_length_ + this->payload_size_};
  }

  ConstBuffer payload() const noexcept
  {
    return ConstBuffer{this->storage_.get() + this->header_length_, this->payload_size_};
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Copies `bytes` to the end of the payload.
   *
   * The caller must have checked `available(bytes.size())`; the buffer must not be closed.
   */
  void append(const ConstBuffer& bytes);

  /** \brief Stamps `id` into the buffer and its header and makes the buffer immutable.  Closing a
   * buffer twice is a usage error.
   */
  void close(u64 id);

  /** \brief Empties the buffer and re-initializes its header for a new owner.
   */
  Status reset(const LogId& log_id);

 private:
  explicit LogBuffer(usize capacity) noexcept;

  usize capacity_;
  std::unique_ptr<char[]> storage_;
  usize header_length_ = 0;
  usize payload_size_ = 0;
  bool closed_ = false;
  u64 id_ = kUnassignedId;
  LogId log_id_;
};

std::ostream& operator<<(std::ostream& out, const LogBuffer& t);

}  // namespace logspool

#endif  // LOGSPOOL_LOG_BUFFER_HPP

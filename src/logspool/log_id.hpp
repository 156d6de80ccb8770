//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_LOG_ID_HPP
#define LOGSPOOL_LOG_ID_HPP

#include <logspool/buffer.hpp>
#include <logspool/int_types.hpp>
#include <logspool/log_metadata.hpp>
#include <logspool/status.hpp>
#include <logspool/timestamp.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace logspool {

class LogId;

/** \brief The result of unpacking the identity framing at the front of a LogBuffer.
 */
struct UnpackedBufferHeader;

/** \brief Identifies one log destination: the stream of records that share a type, shard, client
 * host, property set and header line.
 *
 * LogId is an immutable value type.
 */
class LogId
{
 public:
  using PropertyMap = std::map<std::string, std::string>;

  // Size of the buffer id field at the front of every packed header.
  //
  static constexpr usize kPackedIdSize = sizeof(big_u64);

  // The longest string a packed header can carry.
  //
  static constexpr usize kMaxPackedStringSize = 0xffff;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  LogId() = default;

  explicit LogId(std::string file_prefix_pattern, std::string log_type,
                 std::string client_hostname, i32 shard, PropertyMap properties,
                 std::string headers) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const std::string& file_prefix_pattern() const noexcept
  {
    return this->file_prefix_pattern_;
  }

  const std::string& log_type() const noexcept
  {
    return this->log_type_;
  }

  const std::string& client_hostname() const noexcept
  {
    return this->client_hostname_;
  }

  i32 shard() const noexcept
  {
    return this->shard_;
  }

  const PropertyMap& properties() const noexcept
  {
    return this->properties_;
  }

  // The header line written at the top of every file for this destination.
  //
  const std::string& headers() const noexcept
  {
    return this->headers_;
  }

  /** \brief Returns a canonical string that is equal for two LogIds iff they are equal.
   *
   * Every field is length-prefixed, so no choice of field values can make two different LogIds
   * collide.
   */
  std::string lock_key() const;

  /** \brief Expands `file_pattern` for this destination, the given rotation bucket and version.
   *
   * See `log_id.cpp` for the list of built-in variables; any other `${NAME}` is looked up in the
   * properties.  If the prefix pattern is non-empty it is joined in front of the expanded pattern.
   * The result never starts with '/'.
   */
  StatusOr<std::string> file_name(std::string_view file_pattern, const TimeBucket& bucket,
                                  i32 version) const;

  /** \brief The sidecar metadata for this destination (all fields except the header line).
   */
  LogMetadata metadata() const;

  /** \brief Returns the number of bytes that `pack_header` will produce.
   */
  usize packed_header_size() const;

  /** \brief Serializes `buffer_id` followed by this identity, big-endian.
   *
   * Fails with kLogIdFieldTooLong if any string (or the number of properties) does not fit in a
   * 16-bit length.
   */
  StatusOr<std::string> pack_header(u64 buffer_id) const;

  /** \brief Overwrites the buffer id field of a header previously produced by `pack_header`.
   */
  static void stamp_header_id(MutableBuffer packed_header, u64 buffer_id);

  /** \brief Parses the header at the front of `packed`.
   */
  static StatusOr<UnpackedBufferHeader> unpack_header(const ConstBuffer& packed);

 private:
  std::string file_prefix_pattern_;
  std::string log_type_;
  std::string client_hostname_;
  i32 shard_ = 0;
  PropertyMap properties_;
  std::string headers_;
};

struct UnpackedBufferHeader {
  u64 buffer_id;
  LogId log_id;

  // Number of bytes of the packed buffer that the header occupies.
  //
  usize header_length;
};

bool operator==(const LogId& l, const LogId& r);
bool operator!=(const LogId& l, const LogId& r);

std::ostream& operator<<(std::ostream& out, const LogId& t);

}  // namespace logspool

namespace std {

template <>
struct hash<::logspool::LogId> {
  std::size_t operator()(const ::logspool::LogId& log_id) const
  {
    return std::hash<std::string>{}(log_id.lock_key());
  }
};

}  // namespace std

#endif  // LOGSPOOL_LOG_ID_HPP

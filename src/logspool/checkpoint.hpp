//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_CHECKPOINT_HPP
#define LOGSPOOL_CHECKPOINT_HPP

#include <logspool/buffer.hpp>
#include <logspool/filesystem.hpp>
#include <logspool/int_types.hpp>
#include <logspool/log_buffer.hpp>
#include <logspool/ready_queue.hpp>
#include <logspool/status.hpp>

#include <batteries/static_assert.hpp>

#include <memory>
#include <string>
#include <vector>

namespace logspool {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The first bytes of a ready queue checkpoint file.
//
struct PackedCheckpointHeader {
  static constexpr u64 kMagic = 0x5a0c1e7f2b9d4e61ull;

  static constexpr u32 kCurrentVersion = 1;

  // Must be `kMagic`.
  //
  big_u64 magic;

  little_u32 format_version;

  little_u32 reserved_;

  // The number of PackedCheckpointBufferRecords in the body.
  //
  little_u64 buffer_count;

  // Size in bytes of everything after this header.
  //
  little_u64 body_size;

  // The crc64 of the body.
  //
  little_u64 body_crc64;
};

BATT_STATIC_ASSERT_EQ(sizeof(PackedCheckpointHeader), 40);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Precedes the `data_size` bytes (packed LogId header + payload) of one closed buffer.
//
struct PackedCheckpointBufferRecord {
  little_u64 id;
  little_u32 capacity;
  little_u32 header_length;
  little_u32 data_size;
  little_u32 reserved_;
};

BATT_STATIC_ASSERT_EQ(sizeof(PackedCheckpointBufferRecord), 24);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

/** \brief Serializes the contents of `queue`, head first.
 */
std::string pack_checkpoint(const ReadyQueue& queue);

/** \brief Parses a buffer produced by `pack_checkpoint`; the returned buffers are closed and in
 * their original queue order.
 */
StatusOr<std::vector<std::unique_ptr<LogBuffer>>> unpack_checkpoint(const ConstBuffer& packed);

/** \brief Writes the checkpoint of `queue` to `path`, replacing any existing file.
 */
Status save_checkpoint(const fs::path& path, const ReadyQueue& queue);

StatusOr<std::vector<std::unique_ptr<LogBuffer>>> load_checkpoint(const fs::path& path);

}  // namespace logspool

#endif  // LOGSPOOL_CHECKPOINT_HPP

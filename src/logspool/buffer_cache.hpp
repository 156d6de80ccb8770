//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFER_CACHE_HPP
#define LOGSPOOL_BUFFER_CACHE_HPP

#include <logspool/int_types.hpp>
#include <logspool/log_buffer.hpp>
#include <logspool/log_id.hpp>
#include <logspool/status.hpp>

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace logspool {

/** \brief Recycles released LogBuffers, pooled by capacity.
 *
 * A pool for a given capacity is created the first time a buffer of that capacity is acquired;
 * released buffers of any other capacity are dropped.
 */
class BufferCache
{
 public:
  BufferCache() = default;

  BufferCache(const BufferCache&) = delete;
  BufferCache& operator=(const BufferCache&) = delete;

  /** \brief Returns an empty, open buffer of `capacity` bytes initialized for `log_id`; reuses a
   * pooled buffer when one is available.
   */
  StatusOr<std::unique_ptr<LogBuffer>> acquire(const LogId& log_id, usize capacity);

  /** \brief Gives ownership of `buffer` back to the cache.
   */
  void release(std::unique_ptr<LogBuffer> buffer);

  /** \brief The number of pooled buffers of the given capacity.
   */
  usize size(usize capacity) const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<usize, std::deque<std::unique_ptr<LogBuffer>>> pools_;
};

}  // namespace logspool

#endif  // LOGSPOOL_BUFFER_CACHE_HPP

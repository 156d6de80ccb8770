//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFER_ID_ALLOCATOR_HPP
#define LOGSPOOL_BUFFER_ID_ALLOCATOR_HPP

#include <logspool/int_types.hpp>

#include <atomic>

namespace logspool {

/** \brief Hands out strictly increasing buffer ids; safe to call from any thread.
 */
class BufferIdAllocator
{
 public:
  /** \brief The process-wide allocator, seeded from the wall clock (milliseconds << 16) so that ids
   * keep increasing across restarts.
   */
  static BufferIdAllocator& global();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit BufferIdAllocator(u64 first_id) noexcept : next_id_{first_id}
  {
  }

  BufferIdAllocator(const BufferIdAllocator&) = delete;
  BufferIdAllocator& operator=(const BufferIdAllocator&) = delete;

  u64 allocate() noexcept
  {
    return this->next_id_.fetch_add(1);
  }

  /** \brief Makes sure every id allocated from now on is greater than `id`.
   */
  void advance_past(u64 id) noexcept;

  u64 peek_next() const noexcept
  {
    return this->next_id_.load();
  }

 private:
  std::atomic<u64> next_id_;
};

}  // namespace logspool

#endif  // LOGSPOOL_BUFFER_ID_ALLOCATOR_HPP

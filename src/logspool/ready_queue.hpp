//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_READY_QUEUE_HPP
#define LOGSPOOL_READY_QUEUE_HPP

#include <logspool/buffer_id_allocator.hpp>
#include <logspool/int_types.hpp>
#include <logspool/log_buffer.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace logspool {

/** \brief FIFO of closed LogBuffers waiting to be shipped.
 *
 * Buffers leave the queue only from the head, and only after the consumer passed to `drain`
 * accepted them.
 */
class ReadyQueue
{
 public:
  using ConsumeFn = std::function<bool(const LogBuffer&)>;
  using ReleaseFn = std::function<void(std::unique_ptr<LogBuffer>)>;
  using VisitFn = std::function<void(const LogBuffer&)>;

  explicit ReadyQueue(BufferIdAllocator& id_allocator = BufferIdAllocator::global()) noexcept;

  ReadyQueue(const ReadyQueue&) = delete;
  ReadyQueue& operator=(const ReadyQueue&) = delete;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Closes `buffer` with the next id and appends it to the tail of the queue.  Returns the
   * assigned id.
   */
  u64 enclose(std::unique_ptr<LogBuffer> buffer);

  /** \brief Appends buffers that are already closed (e.g., loaded from a checkpoint), in order.
   * The id allocator is advanced past every restored id.
   */
  void restore(std::vector<std::unique_ptr<LogBuffer>>&& buffers);

  /** \brief Offers buffers to `consume` from the head of the queue.
   *
   * Each accepted buffer is removed and passed to `release`; the first rejected buffer stops the
   * drain and stays at the head.  `should_continue` is checked before each buffer.  Returns the
   * number of buffers removed.
   *
   * Must not be called concurrently with itself.
   */
  usize drain(const ConsumeFn& consume, const ReleaseFn& release,
              const std::function<bool()>& should_continue = nullptr);

  /** \brief Calls `fn` for every queued buffer from head to tail while holding the queue lock.
   */
  void visit(const VisitFn& fn) const;

  usize size() const;

  bool is_empty() const;

  // The total number of bytes (headers included) held by queued buffers.
  //
  usize total_bytes() const;

 private:
  BufferIdAllocator& id_allocator_;

  mutable std::mutex mutex_;

  std::deque<std::unique_ptr<LogBuffer>> buffers_;
};

}  // namespace logspool

#endif  // LOGSPOOL_READY_QUEUE_HPP

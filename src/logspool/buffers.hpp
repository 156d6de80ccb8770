//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFERS_HPP
#define LOGSPOOL_BUFFERS_HPP

#include <logspool/buffer.hpp>
#include <logspool/buffer_cache.hpp>
#include <logspool/buffer_configuration.hpp>
#include <logspool/buffers_metrics.hpp>
#include <logspool/buffers_options.hpp>
#include <logspool/filesystem.hpp>
#include <logspool/log_buffer.hpp>
#include <logspool/log_id.hpp>
#include <logspool/ready_queue.hpp>
#include <logspool/status.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace logspool {

/** \brief Routes records from many destinations into per-destination LogBuffers and spools full
 * buffers in a ReadyQueue until a shipper consumes them.
 *
 * `put` for different destinations proceeds in parallel; puts to the same destination are
 * serialized by a mutex dedicated to that destination.  The ready queue is written to a checkpoint
 * file by `close()` and reloaded (then deleted) when the next Buffers object is created on the
 * same path.  Nothing is persisted between those two points, so buffers that were enclosed but not
 * yet drained are lost if the process exits without calling `close()`.
 */
class Buffers
{
 public:
  using ConsumeFn = ReadyQueue::ConsumeFn;

  explicit Buffers(const fs::path& checkpoint_path, BufferConfigurationMap configurations,
                   const BuffersOptions& options = BuffersOptions::with_default_values());

  Buffers(const Buffers&) = delete;
  Buffers& operator=(const Buffers&) = delete;

  ~Buffers() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Appends `bytes` to the current buffer of `log_id`, moving that buffer to the ready
   * queue first if `bytes` does not fit in its remaining space.
   *
   * Returns kRecordTooLarge (without modifying anything) if `bytes` could never fit in a buffer of
   * the configured size, kNoBufferConfiguration if no configuration matches the log type, and
   * kBuffersClosed after close().
   */
  Status put(const LogId& log_id, const ConstBuffer& bytes);

  Status put(const LogId& log_id, std::string_view bytes)
  {
    return this->put(log_id, as_const_buffer(bytes));
  }

  /** \brief Moves every non-empty current buffer to the ready queue.
   */
  void flush();

  /** \brief Flushes, then passes ready buffers to `consume` in order until it returns false.
   * Accepted buffers are removed from the queue and recycled.  Returns the number accepted.
   */
  usize for_each_ready_data(const ConsumeFn& consume);

  /** \brief Flushes and writes the ready queue to the checkpoint file.  May only be called once.
   */
  Status close();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  bool is_empty() const;

  usize ready_buffer_count() const;

  bool is_closed() const noexcept
  {
    return this->closed_.load();
  }

  const BufferCache& cache() const noexcept
  {
    return this->cache_;
  }

  const BuffersMetrics& metrics() const noexcept
  {
    return this->metrics_;
  }

  const fs::path& checkpoint_path() const noexcept
  {
    return this->checkpoint_path_;
  }

 private:
  // The current buffer of one destination.
  //
  struct Slot {
    std::mutex mutex;
    std::unique_ptr<LogBuffer> current;
  };

  void restore_from_checkpoint();

  StatusOr<const BufferConfiguration*> resolve_configuration(const LogId& log_id);

  Slot& slot_for(const std::string& lock_key);

  void enclose(std::unique_ptr<LogBuffer> buffer);

  // Caller must hold `lifecycle_mutex_` (shared or exclusive).
  //
  void flush_impl();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const fs::path checkpoint_path_;

  const BufferConfigurationMap configurations_;

  const BuffersOptions options_;

  BuffersMetrics metrics_;

  BufferCache cache_;

  ReadyQueue ready_queue_;

  // Shared by put/flush; exclusive for close.
  //
  std::shared_mutex lifecycle_mutex_;

  // Serializes draining with close.
  //
  std::mutex drain_mutex_;

  std::atomic<bool> closed_{false};

  std::mutex config_mutex_;

  std::unordered_map<LogId, const BufferConfiguration*> config_for_log_id_;

  // Slots are created on first use and never removed, so references to them stay valid for the
  // lifetime of this object.
  //
  std::mutex slots_mutex_;

  std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

}  // namespace logspool

#endif  // LOGSPOOL_BUFFERS_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffer_cache.hpp>
//

#include <batteries/assert.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::unique_ptr<LogBuffer>> BufferCache::acquire(const LogId& log_id, usize capacity)
{
  std::unique_ptr<LogBuffer> pooled;
  {
    std::unique_lock<std::mutex> lock{this->mutex_};

    std::deque<std::unique_ptr<LogBuffer>>& pool = this->pools_[capacity];
    if (!pool.empty()) {
      pooled = std::move(pool.front());
      pool.pop_front();
    }
  }

  if (!pooled) {
    return LogBuffer::make_new(log_id, capacity);
  }

  BATT_CHECK_EQ(pooled->capacity(), capacity);

  Status reset_status = pooled->reset(log_id);
  if (!reset_status.ok()) {
    this->release(std::move(pooled));
    return reset_status;
  }

  return pooled;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void BufferCache::release(std::unique_ptr<LogBuffer> buffer)
{
  if (!buffer) {
    return;
  }

  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->pools_.find(buffer->capacity());
  if (iter != this->pools_.end()) {
    iter->second.emplace_back(std::move(buffer));
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize BufferCache::size(usize capacity) const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  auto iter = this->pools_.find(capacity);
  if (iter == this->pools_.end()) {
    return 0;
  }
  return iter->second.size();
}

}  // namespace logspool

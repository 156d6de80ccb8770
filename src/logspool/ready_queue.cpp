//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/ready_queue.hpp>
//

#include <batteries/assert.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
ReadyQueue::ReadyQueue(BufferIdAllocator& id_allocator) noexcept : id_allocator_{id_allocator}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u64 ReadyQueue::enclose(std::unique_ptr<LogBuffer> buffer)
{
  BATT_CHECK_NOT_NULLPTR(buffer);

  std::unique_lock<std::mutex> lock{this->mutex_};

  // The id is allocated under the queue lock so that ids increase from head to tail.
  //
  const u64 id = this->id_allocator_.allocate();
  buffer->close(id);
  this->buffers_.emplace_back(std::move(buffer));

  return id;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void ReadyQueue::restore(std::vector<std::unique_ptr<LogBuffer>>&& buffers)
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  for (std::unique_ptr<LogBuffer>& buffer : buffers) {
    BATT_CHECK_NOT_NULLPTR(buffer);
    BATT_CHECK(buffer->is_closed());

    this->id_allocator_.advance_past(buffer->id());
    this->buffers_.emplace_back(std::move(buffer));
  }
  buffers.clear();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize ReadyQueue::drain(const ConsumeFn& consume, const ReleaseFn& release,
                        const std::function<bool()>& should_continue)
{
  usize drained_count = 0;

  for (;;) {
    if (should_continue && !should_continue()) {
      break;
    }

    // Producers only ever push to the tail, so the head stays valid while we call the consumer
    // without holding the lock.
    //
    const LogBuffer* head = nullptr;
    {
      std::unique_lock<std::mutex> lock{this->mutex_};
      if (this->buffers_.empty()) {
        break;
      }
      head = this->buffers_.front().get();
    }

    if (!consume(*head)) {
      break;
    }

    std::unique_ptr<LogBuffer> consumed;
    {
      std::unique_lock<std::mutex> lock{this->mutex_};
      BATT_CHECK_EQ(this->buffers_.front().get(), head);

      consumed = std::move(this->buffers_.front());
      this->buffers_.pop_front();
    }
    ++drained_count;

    if (release) {
      release(std::move(consumed));
    }
  }

  return drained_count;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void ReadyQueue::visit(const VisitFn& fn) const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  for (const std::unique_ptr<LogBuffer>& buffer : this->buffers_) {
    fn(*buffer);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize ReadyQueue::size() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->buffers_.size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool ReadyQueue::is_empty() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  return this->buffers_.empty();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize ReadyQueue::total_bytes() const
{
  std::unique_lock<std::mutex> lock{this->mutex_};

  usize total = 0;
  for (const std::unique_ptr<LogBuffer>& buffer : this->buffers_) {
    total += buffer->data().size();
  }
  return total;
}

}  // namespace logspool

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffer_id_allocator.hpp>
//

#include <chrono>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BufferIdAllocator& BufferIdAllocator::global()
{
  // Intentionally leaked; ids may be allocated during static destruction.
  //
  static BufferIdAllocator* const instance_ = [] {
    const u64 now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    return new BufferIdAllocator{now_ms << 16};
  }();

  return *instance_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void BufferIdAllocator::advance_past(u64 id) noexcept
{
  u64 observed = this->next_id_.load();
  while (observed <= id) {
    if (this->next_id_.compare_exchange_weak(observed, id + 1)) {
      break;
    }
  }
}

}  // namespace logspool

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffers_options.hpp>
//

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ BuffersOptions BuffersOptions::with_default_values() noexcept
{
  return BuffersOptions{};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BuffersOptions::BuffersOptions() noexcept
    : id_allocator_{&BufferIdAllocator::global()}
    , name_{"default"}
{
}

}  // namespace logspool

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFERS_OPTIONS_HPP
#define LOGSPOOL_BUFFERS_OPTIONS_HPP

#include <logspool/buffer_id_allocator.hpp>

#include <string>
#include <utility>

namespace logspool {

class BuffersOptions
{
 public:
  using Self = BuffersOptions;

  static Self with_default_values() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  BuffersOptions() noexcept;

  // The source of ids for buffers entering the ready queue.
  //
  Self& set_id_allocator(BufferIdAllocator& id_allocator) noexcept
  {
    this->id_allocator_ = &id_allocator;
    return *this;
  }

  BufferIdAllocator& id_allocator() const noexcept
  {
    return *this->id_allocator_;
  }

  // Used as the `name` label of exported metrics.
  //
  Self& set_name(std::string name) noexcept
  {
    this->name_ = std::move(name);
    return *this;
  }

  const std::string& name() const noexcept
  {
    return this->name_;
  }

 private:
  BufferIdAllocator* id_allocator_;
  std::string name_;
};

}  // namespace logspool

#endif  // LOGSPOOL_BUFFERS_OPTIONS_HPP

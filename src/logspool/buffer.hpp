//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFER_HPP
#define LOGSPOOL_BUFFER_HPP

#include <logspool/int_types.hpp>

#include <batteries/buffer.hpp>

#include <string_view>

namespace logspool {

using batt::ConstBuffer;
using batt::MutableBuffer;

// Returns a ConstBuffer that views the bytes of `s`.
//
inline ConstBuffer as_const_buffer(std::string_view s)
{
  return ConstBuffer{s.data(), s.size()};
}

// Returns a string_view over the bytes of `b`.
//
inline std::string_view as_str(const ConstBuffer& b)
{
  return std::string_view{static_cast<const char*>(b.data()), b.size()};
}

}  // namespace logspool

#endif  // LOGSPOOL_BUFFER_HPP

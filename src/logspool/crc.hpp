//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_CRC_HPP
#define LOGSPOOL_CRC_HPP

#include <logspool/buffer.hpp>
#include <logspool/int_types.hpp>

#include <boost/crc.hpp>

namespace logspool {

// Returns a crc64 (ECMA-182 polynomial) calculator in its initial state.
//
boost::crc_basic<64> make_crc64();

// Returns the crc64 of the bytes in `data`.
//
u64 crc64_of(const ConstBuffer& data);

}  // namespace logspool

#endif  // LOGSPOOL_CRC_HPP

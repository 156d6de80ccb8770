//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_WRITER_OPTIONS_HPP
#define LOGSPOOL_WRITER_OPTIONS_HPP

#include <logspool/config.hpp>
#include <logspool/int_types.hpp>
#include <logspool/timestamp.hpp>

#include <chrono>
#include <functional>
#include <ostream>
#include <utility>

namespace logspool {

class WriterOptions
{
 public:
  using Self = WriterOptions;
  using ClockFn = std::function<WallClockTime()>;

  static constexpr usize kDefaultBufferSize = kDefaultWriterBufferSize;

  static constexpr std::chrono::milliseconds kDefaultRefreshInterval =
      kDefaultWriterRefreshInterval;

  /** \brief Returns the default options, with the refresh interval overridden by the env var
   * `LOGSPOOL_WRITER_REFRESH_INTERVAL_MS` if it is set.
   */
  static Self with_default_values();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  WriterOptions() noexcept;

  WriterOptions(const WriterOptions&) = default;
  WriterOptions& operator=(const WriterOptions&) = default;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  // Size of the in-memory buffer between Writer::write and the output file.
  //
  Self& set_buffer_size(usize value) noexcept
  {
    this->buffer_size_ = value;
    return *this;
  }

  usize buffer_size() const noexcept
  {
    return this->buffer_size_;
  }

  // How wall-clock time maps to rotation buckets.
  //
  Self& set_timestamp(const Timestamp& value) noexcept
  {
    this->timestamp_ = value;
    return *this;
  }

  const Timestamp& timestamp() const noexcept
  {
    return this->timestamp_;
  }

  // How often the background thread checks for a bucket change.
  //
  Self& set_refresh_interval(std::chrono::milliseconds value) noexcept
  {
    this->refresh_interval_ = value;
    return *this;
  }

  std::chrono::milliseconds refresh_interval() const noexcept
  {
    return this->refresh_interval_;
  }

  // The source of wall-clock time; defaults to std::chrono::system_clock::now.
  //
  Self& set_clock(ClockFn value) noexcept
  {
    this->clock_ = std::move(value);
    return *this;
  }

  WallClockTime now() const
  {
    return this->clock_();
  }

 private:
  usize buffer_size_ = kDefaultBufferSize;

  Timestamp timestamp_;

  std::chrono::milliseconds refresh_interval_ = kDefaultRefreshInterval;

  ClockFn clock_;
};

std::ostream& operator<<(std::ostream& out, const WriterOptions& t);

}  // namespace logspool

#endif  // LOGSPOOL_WRITER_OPTIONS_HPP

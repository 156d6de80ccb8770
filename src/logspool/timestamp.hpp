//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_TIMESTAMP_HPP
#define LOGSPOOL_TIMESTAMP_HPP

#include <logspool/int_types.hpp>
#include <logspool/status.hpp>

#include <chrono>
#include <ostream>
#include <string>

namespace logspool {

using WallClockTime = std::chrono::system_clock::time_point;

/** \brief One rotation bucket: a fixed-size slice of a UTC hour.
 */
struct TimeBucket {
  i32 year = 0;
  i32 month = 0;
  i32 day = 0;
  i32 hour = 0;

  // The first minute of the bucket.
  //
  i32 minute = 0;

  // Index of the bucket within its hour, in [0, buckets_per_hour).
  //
  i32 interval = 0;

  /** \brief Returns the stable label `YYYY-MM-DDTHH:II` of this bucket, where II is the
   * zero-padded interval index.
   */
  std::string label() const;

  /** \brief The two-digit zero-padded interval index; this is what `${INTERVAL}` expands to.
   */
  std::string interval_str() const;
};

bool operator==(const TimeBucket& l, const TimeBucket& r);
bool operator!=(const TimeBucket& l, const TimeBucket& r);

std::ostream& operator<<(std::ostream& out, const TimeBucket& t);

// Formats `value` as a decimal number left-padded with zeros to `width` digits.
//
std::string zero_pad(i64 value, usize width);

/** \brief Maps wall-clock time to rotation buckets.
 */
class Timestamp
{
 public:
  static const Timestamp kBph1;
  static const Timestamp kBph2;
  static const Timestamp kBph3;
  static const Timestamp kBph4;
  static const Timestamp kBph6;
  static const Timestamp kBph12;
  static const Timestamp kBph20;
  static const Timestamp kBph30;
  static const Timestamp kBph60;

  /** \brief Returns a Timestamp that divides each hour into `buckets_per_hour` equal buckets;
   * `buckets_per_hour` must divide 60.
   */
  static StatusOr<Timestamp> with_buckets_per_hour(i32 buckets_per_hour);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  i32 buckets_per_hour() const noexcept
  {
    return this->buckets_per_hour_;
  }

  i32 minutes_per_bucket() const noexcept
  {
    return 60 / this->buckets_per_hour_;
  }

  TimeBucket bucket_of(WallClockTime t) const;

 private:
  explicit Timestamp(i32 buckets_per_hour) noexcept : buckets_per_hour_{buckets_per_hour}
  {
  }

  i32 buckets_per_hour_;
};

inline bool operator==(const Timestamp& l, const Timestamp& r)
{
  return l.buckets_per_hour() == r.buckets_per_hour();
}

inline bool operator!=(const Timestamp& l, const Timestamp& r)
{
  return !(l == r);
}

std::ostream& operator<<(std::ostream& out, const Timestamp& t);

}  // namespace logspool

#endif  // LOGSPOOL_TIMESTAMP_HPP

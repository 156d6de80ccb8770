//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/timestamp.hpp>
//

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

#include <ctime>
#include <tuple>

namespace logspool {

const Timestamp Timestamp::kBph1{1};
const Timestamp Timestamp::kBph2{2};
const Timestamp Timestamp::kBph3{3};
const Timestamp Timestamp::kBph4{4};
const Timestamp Timestamp::kBph6{6};
const Timestamp Timestamp::kBph12{12};
const Timestamp Timestamp::kBph20{20};
const Timestamp Timestamp::kBph30{30};
const Timestamp Timestamp::kBph60{60};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string zero_pad(i64 value, usize width)
{
  std::string digits = std::to_string(value);
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  return digits;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string TimeBucket::label() const
{
  return zero_pad(this->year, 4) + "-" + zero_pad(this->month, 2) + "-" + zero_pad(this->day, 2) +
         "T" + zero_pad(this->hour, 2) + ":" + this->interval_str();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::string TimeBucket::interval_str() const
{
  return zero_pad(this->interval, 2);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator==(const TimeBucket& l, const TimeBucket& r)
{
  return std::tie(l.year, l.month, l.day, l.hour, l.interval) ==
         std::tie(r.year, r.month, r.day, r.hour, r.interval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool operator!=(const TimeBucket& l, const TimeBucket& r)
{
  return !(l == r);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const TimeBucket& t)
{
  return out << t.label();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Timestamp> Timestamp::with_buckets_per_hour(i32 buckets_per_hour)
{
  if (buckets_per_hour <= 0 || buckets_per_hour > 60 || 60 % buckets_per_hour != 0) {
    return {make_status(StatusCode::kInvalidBucketsPerHour)};
  }
  return Timestamp{buckets_per_hour};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TimeBucket Timestamp::bucket_of(WallClockTime t) const
{
  const std::time_t seconds = std::chrono::system_clock::to_time_t(t);

  std::tm utc;
  BATT_CHECK_NOT_NULLPTR(::gmtime_r(&seconds, &utc));

  TimeBucket bucket;
  bucket.year = utc.tm_year + 1900;
  bucket.month = utc.tm_mon + 1;
  bucket.day = utc.tm_mday;
  bucket.hour = utc.tm_hour;
  bucket.interval = utc.tm_min / this->minutes_per_bucket();
  bucket.minute = bucket.interval * this->minutes_per_bucket();

  return bucket;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Timestamp& t)
{
  return out << "Timestamp{.buckets_per_hour=" << t.buckets_per_hour() << ",}";
}

}  // namespace logspool

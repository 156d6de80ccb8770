//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/log_id.hpp>
//
#include <logspool/log_id.hpp>

#include <logspool/testing/fake_clock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <unordered_set>

namespace {

using namespace logspool::int_types;

using logspool::as_const_buffer;
using logspool::LogId;
using logspool::StatusCode;
using logspool::TimeBucket;
using logspool::Timestamp;
using logspool::testing::FakeClock;

LogId make_test_log_id()
{
  return LogId{"/prefix/${env}", "access", "web-7", 3, LogId::PropertyMap{{"env", "prod"}},
               "REQUEST_ID\tSTATUS"};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, FileNameExpandsBuiltins)
{
  const LogId log_id = make_test_log_id();
  const TimeBucket bucket = Timestamp::kBph12.bucket_of(FakeClock::utc(2015, 10, 10, 1, 14));

  auto name = log_id.file_name(
      "${LOG_TYPE}/${YEAR}-${MONTH}-${DAY}/${HOUR}${MINUTE}-${INTERVAL}-${CLIENT_HOST}-${SHARD}-"
      "${LOG_VERSION}.log.gz",
      bucket, 4);

  ASSERT_TRUE(name.ok()) << name.status();
  EXPECT_EQ(*name, "prefix/prod/access/2015-10-10/0110-02-web-7-3-4.log.gz");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, FileNameWithoutPrefix)
{
  const LogId log_id{"", "type", "log", 0, {}, "H"};
  const TimeBucket bucket = Timestamp::kBph12.bucket_of(FakeClock::utc(2015, 10, 10, 1, 59));

  auto name = log_id.file_name("1-file-${INTERVAL}-${LOG_VERSION}.log.gz", bucket, 1);

  ASSERT_TRUE(name.ok()) << name.status();
  EXPECT_EQ(*name, "1-file-11-1.log.gz");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, FileNameUnknownVariable)
{
  const LogId log_id = make_test_log_id();
  const TimeBucket bucket = Timestamp::kBph12.bucket_of(FakeClock::utc(2015, 10, 10, 1, 14));

  logspool::suppress_log_output_for_test() = true;
  auto name = log_id.file_name("${NO_SUCH_THING}-${LOG_VERSION}", bucket, 1);
  logspool::suppress_log_output_for_test() = false;

  EXPECT_EQ(name.status(), logspool::make_status(StatusCode::kUnknownFilePatternVariable));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, FileNameStaysInsideLogDirectory)
{
  const TimeBucket bucket = Timestamp::kBph12.bucket_of(FakeClock::utc(2015, 10, 10, 1, 14));

  logspool::suppress_log_output_for_test() = true;
  {
    const LogId by_property{"", "type", "log", 0, {{"p", ".."}}, ""};
    EXPECT_EQ(by_property.file_name("${p}/x-${LOG_VERSION}.log", bucket, 1).status(),
              logspool::make_status(StatusCode::kFileNameOutsideLogDirectory));

    const LogId by_prefix{"../../etc", "type", "log", 0, {}, ""};
    EXPECT_EQ(by_prefix.file_name("x-${LOG_VERSION}.log", bucket, 1).status(),
              logspool::make_status(StatusCode::kFileNameOutsideLogDirectory));

    const LogId trailing{"", "type", "log", 0, {{"p", "a/.."}}, ""};
    EXPECT_EQ(trailing.file_name("${p}", bucket, 1).status(),
              logspool::make_status(StatusCode::kFileNameOutsideLogDirectory));
  }
  logspool::suppress_log_output_for_test() = false;

  // Dots inside a component are fine.
  //
  const LogId dotted{"", "type", "log", 0, {{"p", "a..b"}}, ""};
  auto name = dotted.file_name("${p}/...-${LOG_VERSION}.log", bucket, 1);
  ASSERT_TRUE(name.ok()) << name.status();
  EXPECT_EQ(*name, "a..b/...-1.log");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, LockKeyDistinguishesFields)
{
  const LogId a{"", "ab", "c", 0, {}, ""};
  const LogId b{"", "a", "bc", 0, {}, ""};
  const LogId c{"", "ab", "c", 1, {}, ""};
  const LogId d{"", "ab", "c", 0, {{"k", "v"}}, ""};
  const LogId e{"", "ab", "c", 0, {}, "H"};

  std::unordered_set<std::string> keys{a.lock_key(), b.lock_key(), c.lock_key(), d.lock_key(),
                                       e.lock_key()};
  EXPECT_EQ(keys.size(), 5u);

  EXPECT_EQ(a.lock_key(), LogId(a).lock_key());
  EXPECT_EQ(std::hash<LogId>{}(a), std::hash<LogId>{}(LogId{"", "ab", "c", 0, {}, ""}));
  EXPECT_NE(a, b);
  EXPECT_EQ(a, LogId(a));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, Metadata)
{
  const LogId log_id = make_test_log_id();
  const logspool::LogMetadata m = log_id.metadata();

  EXPECT_EQ(m.file_prefix_pattern, "/prefix/${env}");
  EXPECT_EQ(m.log_type, "access");
  EXPECT_EQ(m.shard, "3");
  EXPECT_EQ(m.client_hostname, "web-7");
  EXPECT_EQ(m.properties, log_id.properties());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, PackedHeader)
{
  const LogId log_id = make_test_log_id();

  auto packed = log_id.pack_header(0x0102030405060708ull);
  ASSERT_TRUE(packed.ok()) << packed.status();
  EXPECT_EQ(packed->size(), log_id.packed_header_size());

  // The id is stored big-endian at the front.
  //
  EXPECT_EQ(static_cast<u8>((*packed)[0]), 0x01u);
  EXPECT_EQ(static_cast<u8>((*packed)[7]), 0x08u);

  std::string with_payload = *packed + "payload bytes";

  auto unpacked = LogId::unpack_header(as_const_buffer(with_payload));
  ASSERT_TRUE(unpacked.ok()) << unpacked.status();
  EXPECT_EQ(unpacked->buffer_id, 0x0102030405060708ull);
  EXPECT_EQ(unpacked->log_id, log_id);
  EXPECT_EQ(unpacked->header_length, packed->size());

  LogId::stamp_header_id(logspool::MutableBuffer{with_payload.data(), with_payload.size()}, 99);

  auto restamped = LogId::unpack_header(as_const_buffer(with_payload));
  ASSERT_TRUE(restamped.ok()) << restamped.status();
  EXPECT_EQ(restamped->buffer_id, 99u);
  EXPECT_EQ(restamped->log_id, log_id);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, TruncatedHeader)
{
  const LogId log_id = make_test_log_id();

  auto packed = log_id.pack_header(1);
  ASSERT_TRUE(packed.ok());

  for (usize n : {usize{0}, usize{5}, usize{9}, packed->size() - 1}) {
    auto unpacked = LogId::unpack_header(logspool::ConstBuffer{packed->data(), n});
    EXPECT_EQ(unpacked.status(), logspool::make_status(StatusCode::kLogIdHeaderTruncated)) << n;
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(LogIdTest, FieldTooLong)
{
  const LogId log_id{"", std::string(LogId::kMaxPackedStringSize + 1, 'x'), "h", 0, {}, ""};

  EXPECT_EQ(log_id.pack_header(1).status(),
            logspool::make_status(StatusCode::kLogIdFieldTooLong));
}

}  // namespace

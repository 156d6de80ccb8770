//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffer_cache.hpp>
//
#include <logspool/buffer_cache.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using logspool::as_const_buffer;
using logspool::BufferCache;
using logspool::LogBuffer;
using logspool::LogId;
using logspool::StatusCode;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferCacheTest, ReleasedBuffersAreReused)
{
  BufferCache cache;

  const LogId a{"", "a", "h", 0, {}, ""};
  const LogId b{"", "b", "h", 1, {}, "H"};

  auto first = cache.acquire(a, 128);
  ASSERT_TRUE(first.ok()) << first.status();
  EXPECT_EQ(cache.size(128), 0u);

  (*first)->append(as_const_buffer("data"));
  (*first)->close(10);

  const LogBuffer* const first_ptr = first->get();
  cache.release(std::move(*first));
  EXPECT_EQ(cache.size(128), 1u);

  auto second = cache.acquire(b, 128);
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_EQ(cache.size(128), 0u);

  EXPECT_EQ(second->get(), first_ptr);
  EXPECT_FALSE((*second)->is_closed());
  EXPECT_TRUE((*second)->is_empty());
  EXPECT_EQ((*second)->log_id(), b);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferCacheTest, PoolsAreKeyedByCapacity)
{
  BufferCache cache;

  const LogId log_id{"", "a", "h", 0, {}, ""};

  auto small = cache.acquire(log_id, 64);
  auto large = cache.acquire(log_id, 256);
  ASSERT_TRUE(small.ok());
  ASSERT_TRUE(large.ok());

  cache.release(std::move(*small));
  cache.release(std::move(*large));

  EXPECT_EQ(cache.size(64), 1u);
  EXPECT_EQ(cache.size(256), 1u);

  auto again = cache.acquire(log_id, 256);
  ASSERT_TRUE(again.ok());
  EXPECT_EQ((*again)->capacity(), 256u);
  EXPECT_EQ(cache.size(64), 1u);
  EXPECT_EQ(cache.size(256), 0u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferCacheTest, UnknownCapacityIsDropped)
{
  BufferCache cache;

  auto buffer = LogBuffer::make_new(LogId{"", "a", "h", 0, {}, ""}, 96);
  ASSERT_TRUE(buffer.ok());

  cache.release(std::move(*buffer));
  cache.release(nullptr);

  EXPECT_EQ(cache.size(96), 0u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferCacheTest, ResetFailureReturnsBufferToPool)
{
  BufferCache cache;

  auto buffer = cache.acquire(LogId{"", "a", "h", 0, {}, ""}, 48);
  ASSERT_TRUE(buffer.ok());
  cache.release(std::move(*buffer));
  ASSERT_EQ(cache.size(48), 1u);

  logspool::suppress_log_output_for_test() = true;
  auto too_big = cache.acquire(LogId{"", std::string(64, 'x'), "h", 0, {}, ""}, 48);
  logspool::suppress_log_output_for_test() = false;

  EXPECT_EQ(too_big.status(), logspool::make_status(StatusCode::kRecordTooLarge));
  EXPECT_EQ(cache.size(48), 1u);
}

}  // namespace

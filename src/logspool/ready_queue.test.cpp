//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/ready_queue.hpp>
//
#include <logspool/ready_queue.hpp>

#include <batteries/assert.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using namespace logspool::int_types;

using logspool::as_const_buffer;
using logspool::as_str;
using logspool::BufferIdAllocator;
using logspool::LogBuffer;
using logspool::LogId;
using logspool::ReadyQueue;

std::unique_ptr<LogBuffer> make_buffer(std::string_view payload)
{
  auto result = LogBuffer::make_new(LogId{"", "t", "h", 0, {}, ""}, 128);
  BATT_CHECK_OK(result);

  (*result)->append(as_const_buffer(payload));
  return std::move(*result);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ReadyQueueTest, EncloseAssignsIncreasingIds)
{
  BufferIdAllocator ids{1000};
  ReadyQueue queue{ids};

  EXPECT_TRUE(queue.is_empty());

  const u64 id0 = queue.enclose(make_buffer("a"));
  const u64 id1 = queue.enclose(make_buffer("bb"));
  const u64 id2 = queue.enclose(make_buffer("ccc"));

  EXPECT_EQ(id0, 1000u);
  EXPECT_LT(id0, id1);
  EXPECT_LT(id1, id2);
  EXPECT_EQ(queue.size(), 3u);
  EXPECT_FALSE(queue.is_empty());

  std::vector<u64> visited;
  usize total = 0;
  queue.visit([&](const LogBuffer& buffer) {
    EXPECT_TRUE(buffer.is_closed());
    visited.emplace_back(buffer.id());
    total += buffer.data().size();
  });

  EXPECT_THAT(visited, ::testing::ElementsAre(id0, id1, id2));
  EXPECT_EQ(queue.total_bytes(), total);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ReadyQueueTest, DrainInOrder)
{
  BufferIdAllocator ids{1};
  ReadyQueue queue{ids};

  queue.enclose(make_buffer("one"));
  queue.enclose(make_buffer("two"));
  queue.enclose(make_buffer("three"));

  std::vector<std::string> consumed;
  std::vector<std::unique_ptr<LogBuffer>> released;

  const usize n = queue.drain(
      [&](const LogBuffer& buffer) {
        consumed.emplace_back(as_str(buffer.payload()));
        return true;
      },
      [&](std::unique_ptr<LogBuffer> buffer) {
        released.emplace_back(std::move(buffer));
      });

  EXPECT_EQ(n, 3u);
  EXPECT_THAT(consumed, ::testing::ElementsAre("one", "two", "three"));
  EXPECT_EQ(released.size(), 3u);
  EXPECT_TRUE(queue.is_empty());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ReadyQueueTest, RejectedBufferStaysAtHead)
{
  BufferIdAllocator ids{1};
  ReadyQueue queue{ids};

  queue.enclose(make_buffer("one"));
  const u64 second_id = queue.enclose(make_buffer("two"));

  usize calls = 0;
  const usize n = queue.drain(
      [&](const LogBuffer& buffer) {
        ++calls;
        return buffer.id() != second_id;
      },
      nullptr);

  EXPECT_EQ(n, 1u);
  EXPECT_EQ(calls, 2u);
  ASSERT_EQ(queue.size(), 1u);

  queue.visit([&](const LogBuffer& buffer) {
    EXPECT_EQ(buffer.id(), second_id);
  });

  // should_continue is checked before each buffer.
  //
  const usize m = queue.drain(
      [](const LogBuffer&) {
        return true;
      },
      nullptr,
      [] {
        return false;
      });

  EXPECT_EQ(m, 0u);
  EXPECT_EQ(queue.size(), 1u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(ReadyQueueTest, RestoreAdvancesAllocator)
{
  BufferIdAllocator source_ids{500};
  ReadyQueue source{source_ids};

  source.enclose(make_buffer("x"));
  source.enclose(make_buffer("y"));

  std::vector<std::unique_ptr<LogBuffer>> buffers;
  source.drain(
      [](const LogBuffer&) {
        return true;
      },
      [&](std::unique_ptr<LogBuffer> buffer) {
        buffers.emplace_back(std::move(buffer));
      });

  BufferIdAllocator ids{1};
  ReadyQueue queue{ids};

  queue.restore(std::move(buffers));

  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(ids.peek_next(), 502u);
  EXPECT_EQ(queue.enclose(make_buffer("z")), 502u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferIdAllocatorTest, AdvancePastNeverMovesBackwards)
{
  BufferIdAllocator ids{100};

  ids.advance_past(50);
  EXPECT_EQ(ids.peek_next(), 100u);

  ids.advance_past(100);
  EXPECT_EQ(ids.peek_next(), 101u);

  EXPECT_EQ(ids.allocate(), 101u);
  EXPECT_EQ(ids.peek_next(), 102u);
}

}  // namespace

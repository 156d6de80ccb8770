//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffer_configuration.hpp>
//
#include <logspool/buffer_configuration.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using logspool::BufferConfiguration;
using logspool::BufferConfigurationMap;
using logspool::StatusCode;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferConfigurationTest, FirstMatchWins)
{
  BufferConfigurationMap configs;
  configs.add("access", "^access", 64 * 1024)
      .add("errors", "err", 4 * 1024)
      .add("default", ".*", 16 * 1024);

  EXPECT_EQ(configs.size(), 3u);
  EXPECT_EQ(configs.entries()[1].first, "errors");

  auto access = configs.find("access_log");
  ASSERT_TRUE(access.ok());
  EXPECT_EQ((*access)->buffer_size, 64u * 1024u);
  EXPECT_EQ((*access)->pattern_text, "^access");

  // Patterns may match anywhere in the log type.
  //
  auto errors = configs.find("app-error-log");
  ASSERT_TRUE(errors.ok());
  EXPECT_EQ((*errors)->buffer_size, 4u * 1024u);

  auto fallback = configs.find("metrics");
  ASSERT_TRUE(fallback.ok());
  EXPECT_EQ((*fallback)->buffer_size, 16u * 1024u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(BufferConfigurationTest, NoMatch)
{
  BufferConfigurationMap configs;

  EXPECT_EQ(configs.find("anything").status(),
            logspool::make_status(StatusCode::kNoBufferConfiguration));

  configs.add("only", BufferConfiguration::from_pattern("^only$", 100));

  EXPECT_TRUE(configs.find("only").ok());
  EXPECT_EQ(configs.find("only-not").status(),
            logspool::make_status(StatusCode::kNoBufferConfiguration));
}

}  // namespace

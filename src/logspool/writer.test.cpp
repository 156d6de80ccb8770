//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/writer.hpp>
//
#include <logspool/writer.hpp>

#include <logspool/file_encoding.hpp>
#include <logspool/log_metadata.hpp>
#include <logspool/testing/fake_clock.hpp>
#include <logspool/testing/test_config.hpp>

#include <batteries/assert.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace logspool::int_types;

using logspool::FileEncoding;
using logspool::LogId;
using logspool::StatusCode;
using logspool::Timestamp;
using logspool::Writer;
using logspool::WriterOptions;
using logspool::fs::path;
using logspool::testing::FakeClock;

constexpr const char* kFilePattern = "${p}-file-${INTERVAL}-${LOG_VERSION}.log.gz";

constexpr const char* kContent = "1234567890";

const char* const kMetadataP1 =
    "---\n"
    "filePrefixPattern: \"\"\n"
    "type: \"type\"\n"
    "shard: \"0\"\n"
    "clientHostname: \"log\"\n"
    "p: \"1\"\n";

class WriterTest : public ::testing::Test
{
 public:
  void SetUp() override
  {
    this->logs_ = this->test_config_.make_empty_dir(
        std::string{"WriterTest_"} +
        ::testing::UnitTest::GetInstance()->current_test_info()->name());
  }

  WriterOptions make_options() const
  {
    WriterOptions options;
    options.set_timestamp(Timestamp::kBph12)
        .set_buffer_size(10)
        .set_refresh_interval(std::chrono::hours{1})
        .set_clock(this->clock_.as_clock_fn());
    return options;
  }

  std::unique_ptr<Writer> open_writer(const LogId& log_id,
                                      std::string_view file_pattern = kFilePattern)
  {
    auto writer = Writer::open(this->logs_, file_pattern, log_id, this->make_options());
    BATT_CHECK_OK(writer);
    return std::move(*writer);
  }

  void write(Writer& writer, std::string_view bytes)
  {
    BATT_CHECK_OK(writer.write(bytes, [this](std::string_view message) {
      this->errors_.emplace_back(message);
    }));
  }

  std::string gzip_contents(const path& file) const
  {
    auto contents = logspool::read_decoded_file(this->logs_ / file, FileEncoding::kGzip);
    BATT_CHECK_OK(contents) << BATT_INSPECT(file);
    return std::move(*contents);
  }

  std::string plain_contents(const path& file) const
  {
    auto contents = logspool::read_file_to_string((this->logs_ / file).string());
    BATT_CHECK_OK(contents) << BATT_INSPECT(file);
    return std::move(*contents);
  }

  logspool::testing::TestConfig test_config_;
  path logs_;
  FakeClock clock_{FakeClock::utc(2015, 10, 10, 1, 0)};
  std::vector<std::string> errors_;

  const LogId log_id_{"", "type", "log", 0, {{"p", "1"}}, "REQUEST_ID"};
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, RotateVersionAndQuarantine)
{
  const std::string content = kContent;

  ASSERT_TRUE(logspool::write_file((this->logs_ / "1-file-00-1.log.gz").string(),
                                   logspool::as_const_buffer("corrupted file"))
                  .ok());
  ASSERT_TRUE(logspool::write_file((this->logs_ / "1-file-00-1.log.gz.metadata.yaml").string(),
                                   logspool::as_const_buffer(kMetadataP1))
                  .ok());

  logspool::suppress_log_output_for_test() = true;
  {
    std::unique_ptr<Writer> writer = this->open_writer(this->log_id_);

    this->write(*writer, content);

    this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 5));
    this->write(*writer, content);

    this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 10));
    this->write(*writer, content);

    ASSERT_TRUE(writer->close().ok());
  }
  logspool::suppress_log_output_for_test() = false;

  ASSERT_EQ(this->errors_.size(), 1u);
  EXPECT_THAT(this->errors_[0], ::testing::HasSubstr("corrupted file, cannot append"));
  EXPECT_THAT(this->errors_[0], ::testing::HasSubstr("1-file-00-1.log.gz"));
  {
    std::unique_ptr<Writer> writer = this->open_writer(this->log_id_);

    // Reopening an existing compatible file appends to it.
    //
    this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 14));
    this->write(*writer, content);

    this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 59));
    this->write(*writer, content);

    ASSERT_TRUE(writer->close().ok());
  }
  {
    std::unique_ptr<Writer> writer =
        this->open_writer(LogId{"", "type", "log", 0, {{"p", "1"}}, "REQUEST_ID\tH2"});

    this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 14));
    this->write(*writer, content);

    EXPECT_EQ(writer->version(), 2);

    ASSERT_TRUE(writer->close().ok());
  }

  EXPECT_EQ(this->gzip_contents("1-file-00-1.log.gz"), "REQUEST_ID\n" + content);

  EXPECT_EQ(this->gzip_contents("1-file-01-1.log.gz"), "REQUEST_ID\n" + content);
  EXPECT_EQ(this->plain_contents("1-file-01-1.log.gz.metadata.yaml"), kMetadataP1);

  EXPECT_EQ(this->gzip_contents("1-file-02-1.log.gz"), "REQUEST_ID\n" + content + content);
  EXPECT_EQ(this->plain_contents("1-file-02-1.log.gz.metadata.yaml"), kMetadataP1);

  EXPECT_EQ(this->gzip_contents("1-file-11-1.log.gz"), "REQUEST_ID\n" + content);

  EXPECT_EQ(this->plain_contents(".corrupted/1-file-00-1.log.gz"), "corrupted file");
  EXPECT_EQ(this->plain_contents(".corrupted/1-file-00-1.log.gz.metadata.yaml"), kMetadataP1);

  EXPECT_EQ(this->gzip_contents("1-file-02-2.log.gz"), "REQUEST_ID\tH2\n" + content);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, MetadataChanged)
{
  const std::string content = kContent;

  {
    std::unique_ptr<Writer> writer = this->open_writer(this->log_id_);
    this->write(*writer, content);
    ASSERT_TRUE(writer->close().ok());
  }
  {
    std::unique_ptr<Writer> writer =
        this->open_writer(LogId{"", "type", "log", 0, {{"p", "1"}, {"p2", "2"}}, "REQUEST_ID"});
    this->write(*writer, content);
    ASSERT_TRUE(writer->close().ok());
  }

  EXPECT_EQ(this->gzip_contents("1-file-00-1.log.gz"), "REQUEST_ID\n" + content);
  EXPECT_EQ(this->plain_contents("1-file-00-1.log.gz.metadata.yaml"), kMetadataP1);

  EXPECT_EQ(this->gzip_contents("1-file-00-2.log.gz"), "REQUEST_ID\n" + content);
  EXPECT_EQ(this->plain_contents("1-file-00-2.log.gz.metadata.yaml"),
            std::string{kMetadataP1} + "p2: \"2\"\n");

  EXPECT_TRUE(this->errors_.empty());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, PatternWithoutVersion)
{
  logspool::suppress_log_output_for_test() = true;
  auto writer = Writer::open(this->logs_, "${p}-file-${INTERVAL}.log.gz", this->log_id_,
                             this->make_options());
  logspool::suppress_log_output_for_test() = false;

  EXPECT_EQ(writer.status(), logspool::make_status(StatusCode::kFilePatternMissingVersion));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, UnknownPatternVariable)
{
  logspool::suppress_log_output_for_test() = true;
  auto writer = Writer::open(this->logs_, "${nope}-${LOG_VERSION}.log", this->log_id_,
                             this->make_options());
  logspool::suppress_log_output_for_test() = false;

  EXPECT_EQ(writer.status(), logspool::make_status(StatusCode::kUnknownFilePatternVariable));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, FileNameOutsideLogDirectory)
{
  const LogId log_id{"", "type", "log", 0, {{"p", "../escaped"}}, "REQUEST_ID"};

  logspool::suppress_log_output_for_test() = true;
  auto writer = Writer::open(this->logs_, kFilePattern, log_id, this->make_options());
  logspool::suppress_log_output_for_test() = false;

  EXPECT_EQ(writer.status(), logspool::make_status(StatusCode::kFileNameOutsideLogDirectory));
  EXPECT_FALSE(logspool::fs::exists(this->logs_.parent_path() / "escaped-file-00-1.log.gz"));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, PlainFilesAndNestedDirectories)
{
  const LogId log_id{"archive/${LOG_TYPE}", "events", "host-9", 4, {}, "A\tB"};

  std::unique_ptr<Writer> writer = this->open_writer(
      log_id, "${YEAR}-${MONTH}-${DAY}/${HOUR}${MINUTE}-${CLIENT_HOST}-${SHARD}-${LOG_VERSION}.tsv");

  auto expected_path = writer->current_file_path();
  ASSERT_TRUE(expected_path.ok()) << expected_path.status();
  EXPECT_EQ(*expected_path, this->logs_ / "archive/events/2015-10-10/0100-host-9-4-1.tsv");

  EXPECT_FALSE(writer->is_file_open());
  this->write(*writer, "1\t2\n");
  EXPECT_TRUE(writer->is_file_open());
  this->write(*writer, "3\t4\n");

  ASSERT_TRUE(writer->close().ok());
  EXPECT_FALSE(writer->is_file_open());

  auto contents = logspool::read_file_to_string(expected_path->string());
  ASSERT_TRUE(contents.ok()) << contents.status();
  EXPECT_EQ(*contents, "A\tB\n1\t2\n3\t4\n");

  auto metadata = logspool::LogMetadata::read_for_file(*expected_path);
  ASSERT_TRUE(metadata.ok()) << metadata.status();
  EXPECT_EQ(*metadata, log_id.metadata());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, RefreshClosesIdleFile)
{
  std::unique_ptr<Writer> writer = this->open_writer(this->log_id_);

  const u64 closed_before = Writer::metrics().closed_file_count.load();

  this->write(*writer, kContent);
  EXPECT_TRUE(writer->is_file_open());

  // Same bucket: nothing happens.
  //
  this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 4, 59));
  ASSERT_TRUE(writer->refresh().ok());
  EXPECT_TRUE(writer->is_file_open());

  this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 5));
  ASSERT_TRUE(writer->refresh().ok());
  EXPECT_FALSE(writer->is_file_open());
  EXPECT_EQ(writer->bucket().interval, 1);
  EXPECT_EQ(writer->version(), 1);

  EXPECT_EQ(Writer::metrics().closed_file_count.load(), closed_before + 1);

  ASSERT_TRUE(writer->close().ok());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, BackgroundRefresh)
{
  WriterOptions options = this->make_options();
  options.set_refresh_interval(std::chrono::milliseconds{5});

  auto result = Writer::open(this->logs_, kFilePattern, this->log_id_, options);
  ASSERT_TRUE(result.ok()) << result.status();
  Writer& writer = **result;

  this->write(writer, kContent);
  EXPECT_TRUE(writer.is_file_open());

  this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 30));

  for (usize i = 0; i < 2000 && writer.is_file_open(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  EXPECT_FALSE(writer.is_file_open());

  // The file was fully written when it was closed.
  //
  EXPECT_EQ(this->gzip_contents("1-file-00-1.log.gz"), std::string{"REQUEST_ID\n"} + kContent);

  ASSERT_TRUE(writer.close().ok());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, TooManyVersions)
{
  // Occupy every allowed version with files whose header does not match.
  //
  for (i32 version = 1; version <= logspool::kMaxLogVersion; ++version) {
    const path file = this->logs_ / ("1-file-00-" + std::to_string(version) + ".log");
    ASSERT_TRUE(
        logspool::write_file(file.string(), logspool::as_const_buffer("OTHER_HEADER\n")).ok());
    ASSERT_TRUE(this->log_id_.metadata().write_for_file(file).ok());
  }

  std::unique_ptr<Writer> writer =
      this->open_writer(this->log_id_, "${p}-file-${INTERVAL}-${LOG_VERSION}.log");

  logspool::suppress_log_output_for_test() = true;
  EXPECT_EQ(writer->write(kContent, nullptr),
            logspool::make_status(StatusCode::kTooManyLogVersions));

  // Retrying in the same bucket must not open a version past the limit.
  //
  EXPECT_EQ(writer->write(kContent, nullptr),
            logspool::make_status(StatusCode::kTooManyLogVersions));
  logspool::suppress_log_output_for_test() = false;

  EXPECT_FALSE(writer->is_file_open());
  EXPECT_EQ(writer->version(), logspool::kMaxLogVersion);
  EXPECT_FALSE(logspool::fs::exists(
      this->logs_ / ("1-file-00-" + std::to_string(logspool::kMaxLogVersion + 1) + ".log")));

  // A new bucket starts over at version 1.
  //
  this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 5));
  this->write(*writer, kContent);
  EXPECT_EQ(writer->version(), 1);

  ASSERT_TRUE(writer->close().ok());
  EXPECT_EQ(this->plain_contents("1-file-01-1.log"), std::string{"REQUEST_ID\n"} + kContent);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, IoFailureResetsOutput)
{
  std::unique_ptr<Writer> writer =
      this->open_writer(this->log_id_, "${p}-file-${INTERVAL}-${LOG_VERSION}.log");

  this->write(*writer, kContent);
  EXPECT_TRUE(writer->is_file_open());

  // A directory where the next bucket's file belongs cannot be read as a log file.
  //
  const path blocked = this->logs_ / "1-file-01-1.log";
  ASSERT_TRUE(logspool::fs::create_directories(blocked));

  this->clock_.set(FakeClock::utc(2015, 10, 10, 1, 5));

  logspool::suppress_log_output_for_test() = true;
  const logspool::Status status = writer->write(kContent, nullptr);
  logspool::suppress_log_output_for_test() = false;

  EXPECT_FALSE(status.ok());
  EXPECT_FALSE(writer->is_file_open());
  EXPECT_EQ(this->plain_contents("1-file-00-1.log"), std::string{"REQUEST_ID\n"} + kContent);

  ASSERT_EQ(logspool::fs::remove_all(blocked), 1u);

  this->write(*writer, kContent);
  EXPECT_TRUE(writer->is_file_open());

  ASSERT_TRUE(writer->close().ok());
  EXPECT_EQ(this->plain_contents("1-file-01-1.log"), std::string{"REQUEST_ID\n"} + kContent);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(WriterTest, WriteAfterClose)
{
  std::unique_ptr<Writer> writer = this->open_writer(this->log_id_);

  ASSERT_TRUE(writer->close().ok());
  ASSERT_TRUE(writer->close().ok());

  EXPECT_EQ(writer->write(kContent, nullptr), logspool::make_status(StatusCode::kWriterClosed));
}

}  // namespace

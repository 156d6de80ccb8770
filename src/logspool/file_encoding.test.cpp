//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/file_encoding.hpp>
//
#include <logspool/file_encoding.hpp>

#include <logspool/output_stream.hpp>
#include <logspool/testing/test_config.hpp>

#include <batteries/assert.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace {

using namespace logspool::int_types;

using logspool::as_const_buffer;
using logspool::encoding_from_path;
using logspool::FileEncoding;
using logspool::fs::path;

class FileEncodingTest : public ::testing::Test
{
 public:
  void SetUp() override
  {
    this->dir_ = this->test_config_.make_empty_dir(
        std::string{"FileEncodingTest_"} +
        ::testing::UnitTest::GetInstance()->current_test_info()->name());
  }

  path write_plain(std::string_view name, std::string_view contents)
  {
    const path file = this->dir_ / std::string{name};
    BATT_CHECK_OK(logspool::write_file(file.string(), as_const_buffer(contents)));
    return file;
  }

  path write_gzip(std::string_view name, std::string_view contents)
  {
    const path file = this->dir_ / std::string{name};
    auto out = logspool::OutputStream::open(file, FileEncoding::kGzip, 1024,
                                            logspool::OpenForAppend{false});
    BATT_CHECK_OK(out);
    BATT_CHECK_OK((*out)->write(contents));
    BATT_CHECK_OK((*out)->close());
    return file;
  }

  logspool::testing::TestConfig test_config_;
  path dir_;
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(FileEncodingTest, EncodingFromPath)
{
  EXPECT_EQ(encoding_from_path("a/b/c.log.gz"), FileEncoding::kGzip);
  EXPECT_EQ(encoding_from_path("c.gz"), FileEncoding::kGzip);
  EXPECT_EQ(encoding_from_path("c.log"), FileEncoding::kPlain);
  EXPECT_EQ(encoding_from_path("c.gzip"), FileEncoding::kPlain);
  EXPECT_EQ(encoding_from_path("gz"), FileEncoding::kPlain);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(FileEncodingTest, CorruptedGzip)
{
  const path not_gzip = this->write_plain("corrupted.log.gz", "corrupted file");
  const path empty = this->write_plain("empty.log.gz", "");

  const path good = this->write_gzip("good.log.gz", "H1\tH2\nsome data that compresses\n");
  auto good_bytes = logspool::read_file_to_string(good.string());
  ASSERT_TRUE(good_bytes.ok());
  const path truncated =
      this->write_plain("truncated.log.gz", good_bytes->substr(0, good_bytes->size() - 6));

  for (const path& file : {not_gzip, empty, truncated}) {
    auto valid = logspool::is_file_encoding_valid(file, FileEncoding::kGzip);
    ASSERT_TRUE(valid.ok()) << file << valid.status();
    EXPECT_FALSE(*valid) << file;

    EXPECT_EQ(logspool::read_decoded_file(file, FileEncoding::kGzip).status(),
              logspool::make_status(logspool::StatusCode::kGzipReadFailed))
        << file;
  }

  auto valid = logspool::is_file_encoding_valid(good, FileEncoding::kGzip);
  ASSERT_TRUE(valid.ok());
  EXPECT_TRUE(*valid);

  // Plain files are never structurally invalid.
  //
  auto plain_valid = logspool::is_file_encoding_valid(not_gzip, FileEncoding::kPlain);
  ASSERT_TRUE(plain_valid.ok());
  EXPECT_TRUE(*plain_valid);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(FileEncodingTest, ConcatenatedGzipMembers)
{
  const path a = this->write_gzip("a.gz", "first member\n");
  const path b = this->write_gzip("b.gz", "second member\n");

  auto a_bytes = logspool::read_file_to_string(a.string());
  auto b_bytes = logspool::read_file_to_string(b.string());
  ASSERT_TRUE(a_bytes.ok());
  ASSERT_TRUE(b_bytes.ok());

  const path both = this->write_plain("both.gz", *a_bytes + *b_bytes);

  auto contents = logspool::read_decoded_file(both, FileEncoding::kGzip);
  ASSERT_TRUE(contents.ok()) << contents.status();
  EXPECT_EQ(*contents, "first member\nsecond member\n");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(FileEncodingTest, HeaderLine)
{
  const path commented = this->write_plain("commented.log", "\n# comment\n  \n  A\tB  \nrest\n");
  const path blank = this->write_plain("blank.log", "\n\n# only comments\n");
  const path gz = this->write_gzip("header.log.gz", "#x\nREQUEST_ID\n1234567890");

  auto header = logspool::read_header_line(commented, FileEncoding::kPlain);
  ASSERT_TRUE(header.ok()) << header.status();
  ASSERT_TRUE(*header);
  EXPECT_EQ(**header, "A\tB");

  auto none = logspool::read_header_line(blank, FileEncoding::kPlain);
  ASSERT_TRUE(none.ok()) << none.status();
  EXPECT_FALSE(*none);

  auto gz_header = logspool::read_header_line(gz, FileEncoding::kGzip);
  ASSERT_TRUE(gz_header.ok()) << gz_header.status();
  ASSERT_TRUE(*gz_header);
  EXPECT_EQ(**gz_header, "REQUEST_ID");

  // Stopping early is allowed.
  //
  std::string first_chunk;
  ASSERT_TRUE(logspool::read_decoded(gz, FileEncoding::kGzip,
                                     [&](std::string_view chunk) {
                                       first_chunk = std::string{chunk};
                                       return false;
                                     })
                  .ok());
  EXPECT_FALSE(first_chunk.empty());
}

}  // namespace

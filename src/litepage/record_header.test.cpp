//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/record_header.hpp>
//
#include <litepage/record_header.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <litepage/status_code.hpp>

#include <array>
#include <vector>

namespace {

using namespace litepage::int_types;

using litepage::ConstBuffer;
using litepage::make_status;
using litepage::MutableBuffer;
using litepage::RecordHeader;
using litepage::SerialType;
using litepage::StatusCode;
using litepage::StatusOr;

StatusOr<RecordHeader> parse(const std::vector<u8>& bytes)
{
  return litepage::parse_record_header(ConstBuffer{bytes.data(), bytes.size()});
}

TEST(RecordHeaderTest, ParseSimple)
{
  // header size 4: [i8, text(3), null]
  //
  const std::vector<u8> bytes = {0x04, 0x01, 0x13, 0x00, /*body*/ 0x2a, 'a', 'b', 'c'};

  StatusOr<RecordHeader> header = parse(bytes);
  ASSERT_TRUE(header.ok()) << header.status();

  EXPECT_EQ(header->header_size, 4u);
  EXPECT_THAT(header->serial_types,
              ::testing::ElementsAre(SerialType::i8(), SerialType::text(3), SerialType::null()));
  EXPECT_EQ(header->body_size(), 4u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RecordHeaderTest, ParseMultiByteSerialType)
{
  // blob(100) == 212, which takes two varint bytes: 0x81 0x54.
  //
  const std::vector<u8> bytes = {0x04, 0x81, 0x54, 0x09};

  StatusOr<RecordHeader> header = parse(bytes);
  ASSERT_TRUE(header.ok()) << header.status();

  EXPECT_THAT(header->serial_types,
              ::testing::ElementsAre(SerialType::blob(100), SerialType::const_int1()));
  EXPECT_EQ(header->body_size(), 100u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RecordHeaderTest, Corruption)
{
  const litepage::Status corrupt_header = make_status(StatusCode::kCorruptRecordHeader);

  // Empty input.
  EXPECT_EQ(parse({}).status(), corrupt_header);

  // Header size larger than the input.
  EXPECT_EQ(parse({0x05, 0x01, 0x01}).status(), corrupt_header);

  // Header size smaller than its own varint.
  EXPECT_EQ(parse({0x00, 0x01}).status(), corrupt_header);

  // Serial type varint runs past the end of the header.
  EXPECT_EQ(parse({0x02, 0x81, 0x01}).status(), corrupt_header);

  // Reserved serial type.
  EXPECT_EQ(parse({0x03, 0x01, 0x0a}).status(), make_status(StatusCode::kCorruptSerialType));

  EXPECT_TRUE(litepage::status_is_corruption(corrupt_header));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RecordHeaderTest, PackThenParse)
{
  const std::vector<SerialType> serial_types = {
      SerialType::i64(), SerialType::f64(), SerialType::text(1000), SerialType::blob(0)};

  const usize expected_size = 1 /*size*/ + 1 + 1 + 2 /*2013*/ + 1;
  EXPECT_EQ(litepage::packed_sizeof_record_header(serial_types), expected_size);

  std::array<u8, 16> storage;
  storage.fill(0xee);

  StatusOr<usize> packed = litepage::pack_record_header(
      serial_types, MutableBuffer{storage.data(), storage.size()});
  ASSERT_TRUE(packed.ok()) << packed.status();
  EXPECT_EQ(*packed, expected_size);
  EXPECT_EQ(storage[0], expected_size);
  EXPECT_EQ(storage[expected_size], 0xee);

  StatusOr<RecordHeader> header =
      litepage::parse_record_header(ConstBuffer{storage.data(), *packed});
  ASSERT_TRUE(header.ok()) << header.status();
  EXPECT_EQ(header->header_size, expected_size);
  EXPECT_EQ(header->serial_types, serial_types);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RecordHeaderTest, SizeVarintCountsItself)
{
  // 126 one-byte serial types + a 1-byte size == 127, still fits one byte; one more column pushes
  // the size to 129, which needs a 2-byte size varint.
  //
  std::vector<SerialType> serial_types(126, SerialType::null());
  EXPECT_EQ(litepage::packed_sizeof_record_header(serial_types), 127u);

  serial_types.emplace_back(SerialType::null());
  EXPECT_EQ(litepage::packed_sizeof_record_header(serial_types), 129u);

  std::vector<u8> storage(129);
  ASSERT_TRUE(litepage::pack_record_header(serial_types,
                                           MutableBuffer{storage.data(), storage.size()})
                  .ok());
  EXPECT_EQ(storage[0], 0x81);
  EXPECT_EQ(storage[1], 0x01);

  StatusOr<RecordHeader> header = parse(storage);
  ASSERT_TRUE(header.ok()) << header.status();
  EXPECT_EQ(header->serial_types.size(), 127u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(RecordHeaderTest, PackBufferTooSmall)
{
  std::array<u8, 2> storage;

  StatusOr<usize> packed = litepage::pack_record_header(
      {SerialType::i8(), SerialType::i8()}, MutableBuffer{storage.data(), storage.size()});

  EXPECT_EQ(packed.status(), make_status(StatusCode::kRecordHeaderBufferTooSmall));
}

}  // namespace

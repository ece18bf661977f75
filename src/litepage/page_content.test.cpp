//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/page_content.hpp>
//
#include <litepage/page_content.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <litepage/status_code.hpp>

#include <batteries/stream_util.hpp>

namespace {

using namespace litepage::int_types;

using litepage::Freeblock;
using litepage::IoBuffer;
using litepage::make_status;
using litepage::PageContent;
using litepage::PageType;
using litepage::StatusCode;
using litepage::StatusOr;

constexpr usize kPageSize = 4096;

// Returns a page buffer whose B-tree header (at `offset`) starts with the given type byte.
//
std::shared_ptr<IoBuffer> make_page(u8 page_type, usize offset = 0)
{
  std::shared_ptr<IoBuffer> buffer = IoBuffer::allocate(kPageSize);
  buffer->data()[offset] = page_type;
  return buffer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, Classification)
{
  struct Case {
    u8 type_byte;
    PageType page_type;
    usize header_size;
    bool leaf;
    bool table;
  };

  for (const Case& c : {
           Case{13, PageType::kTableLeaf, 8, true, true},
           Case{5, PageType::kTableInterior, 12, false, true},
           Case{10, PageType::kIndexLeaf, 8, true, false},
           Case{2, PageType::kIndexInterior, 12, false, false},
       }) {
    PageContent page{0, make_page(c.type_byte)};

    ASSERT_TRUE(page.page_type().ok());
    EXPECT_EQ(*page.page_type(), c.page_type);
    ASSERT_TRUE(page.maybe_page_type());
    EXPECT_EQ(*page.maybe_page_type(), c.page_type);
    EXPECT_EQ(*page.header_size(), c.header_size) << BATT_INSPECT(c.page_type);
    EXPECT_EQ(*page.is_leaf(), c.leaf);
    EXPECT_EQ(*page.is_interior(), !c.leaf);
    EXPECT_EQ(*page.is_table(), c.table);
    EXPECT_EQ(*page.is_index(), !c.table);
    EXPECT_EQ(page.rightmost_pointer().ok(), !c.leaf);
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, CorruptPageType)
{
  for (u8 type_byte : {0, 1, 3, 4, 6, 9, 11, 12, 14, 255}) {
    PageContent page{0, make_page(type_byte)};

    EXPECT_EQ(page.page_type().status(), make_status(StatusCode::kCorruptPageType));
    EXPECT_FALSE(page.maybe_page_type());
    EXPECT_EQ(page.header_size().status(), make_status(StatusCode::kCorruptPageType));
    EXPECT_EQ(page.rightmost_pointer().status(), make_status(StatusCode::kCorruptPageType));
    EXPECT_EQ(page.unallocated_region_size().status(), make_status(StatusCode::kCorruptPageType));
    EXPECT_TRUE(litepage::status_is_corruption(page.page_type().status()));
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, HeaderFieldsAreBigEndian)
{
  std::shared_ptr<IoBuffer> buffer = make_page(13);
  PageContent page{0, buffer};

  page.write_first_freeblock(0x0123);
  page.write_cell_count(0x0405);
  ASSERT_TRUE(page.write_cell_content_area(0x0f00).ok());
  page.write_fragmented_bytes_count(7);

  EXPECT_THAT(std::vector<u8>(buffer->data(), buffer->data() + 8),
              ::testing::ElementsAre(13, 0x01, 0x23, 0x04, 0x05, 0x0f, 0x00, 7));

  EXPECT_EQ(page.first_freeblock(), 0x0123u);
  EXPECT_EQ(page.cell_count(), 0x0405u);
  EXPECT_EQ(page.cell_content_area(), 0x0f00u);
  EXPECT_EQ(page.fragmented_bytes_count(), 7u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, CellContentAreaZeroMeans65536)
{
  std::shared_ptr<IoBuffer> buffer = IoBuffer::allocate(65536);
  buffer->data()[0] = 13;
  PageContent page{0, buffer};

  EXPECT_EQ(page.cell_content_area(), 65536u);

  ASSERT_TRUE(page.write_cell_content_area(1024).ok());
  EXPECT_EQ(page.cell_content_area(), 1024u);

  ASSERT_TRUE(page.write_cell_content_area(65536).ok());
  EXPECT_EQ(page.read_u16(litepage::kBTreeCellContentAreaOffset), 0u);
  EXPECT_EQ(page.cell_content_area(), 65536u);

  EXPECT_EQ(page.write_cell_content_area(65537), batt::Status{batt::StatusCode::kInvalidArgument});
  EXPECT_EQ(page.write_cell_content_area(0), batt::Status{batt::StatusCode::kInvalidArgument});
  EXPECT_EQ(page.cell_content_area(), 65536u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, RightmostPointer)
{
  std::shared_ptr<IoBuffer> buffer = make_page(5);
  PageContent interior{0, buffer};

  ASSERT_TRUE(interior.write_rightmost_pointer(0xdeadbeef).ok());
  EXPECT_EQ(*interior.rightmost_pointer(), 0xdeadbeefu);
  EXPECT_THAT(std::vector<u8>(buffer->data() + 8, buffer->data() + 12),
              ::testing::ElementsAre(0xde, 0xad, 0xbe, 0xef));

  PageContent leaf{0, make_page(10)};
  EXPECT_EQ(leaf.rightmost_pointer().status(),
            make_status(StatusCode::kRightmostPointerNotApplicable));
  EXPECT_EQ(leaf.write_rightmost_pointer(7),
            make_status(StatusCode::kRightmostPointerNotApplicable));
  EXPECT_EQ(leaf.read_u32(litepage::kBTreeRightmostPointerOffset), 0u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, FirstPageSkipsDatabaseHeader)
{
  std::shared_ptr<IoBuffer> buffer = make_page(13, litepage::kDatabaseHeaderSize);

  PageContent page_one = PageContent::for_page(1, buffer);
  EXPECT_EQ(page_one.offset(), 100u);
  EXPECT_EQ(*page_one.page_type(), PageType::kTableLeaf);

  page_one.write_cell_count(3);
  EXPECT_EQ(buffer->data()[100 + litepage::kBTreeCellCountOffset + 1], 3u);
  EXPECT_EQ(buffer->data()[litepage::kBTreeCellCountOffset + 1], 0u);

  // The cell pointer array is reported as an absolute offset.
  //
  EXPECT_EQ(*page_one.cell_pointer_array_offset(), 108u);
  EXPECT_EQ(*page_one.unallocated_region_start(), 114u);

  PageContent page_two = PageContent::for_page(2, make_page(5));
  EXPECT_EQ(page_two.offset(), 0u);
  EXPECT_EQ(*page_two.cell_pointer_array_offset(), 12u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, CellPointers)
{
  std::shared_ptr<IoBuffer> buffer = make_page(13);
  PageContent page{0, buffer};

  page.write_cell_count(3);
  ASSERT_TRUE(page.write_cell_content_area(4000).ok());

  ASSERT_TRUE(page.write_cell_pointer(0, 4090).ok());
  ASSERT_TRUE(page.write_cell_pointer(1, 4050).ok());
  ASSERT_TRUE(page.write_cell_pointer(2, 4000).ok());

  EXPECT_EQ(page.cell_pointer_array_size(), 6u);
  EXPECT_EQ(*page.cell_pointer(0), 4090u);
  EXPECT_EQ(*page.cell_pointer(1), 4050u);
  EXPECT_EQ(*page.cell_pointer(2), 4000u);
  EXPECT_EQ(page.read_u16_absolute(8 + 2 * 1), 4050u);

  EXPECT_EQ(page.cell_pointer(3).status(), batt::Status{batt::StatusCode::kOutOfRange});
  EXPECT_EQ(page.write_cell_pointer(3, 100), batt::Status{batt::StatusCode::kOutOfRange});
  EXPECT_EQ(page.write_cell_pointer(0, 4096), batt::Status{batt::StatusCode::kOutOfRange});

  // A stored pointer that lies outside the page is corrupt.
  //
  page.write_u16_absolute(8, 5000);
  EXPECT_EQ(page.cell_pointer(0).status(), make_status(StatusCode::kCorruptCellPointer));

  EXPECT_EQ(*page.unallocated_region_start(), 14u);
  EXPECT_EQ(*page.unallocated_region_size(), 4000u - 14u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, CellPointerArrayPastEndOfPage)
{
  PageContent page{0, make_page(13)};

  page.write_cell_count(0xffff);

  EXPECT_TRUE(page.cell_pointer(0).ok());
  EXPECT_EQ(page.cell_pointer(3000).status(), make_status(StatusCode::kCorruptCellPointer));
  EXPECT_EQ(page.write_cell_pointer(3000, 1), make_status(StatusCode::kCorruptCellPointer));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, UnallocatedRegionMustNotBeNegative)
{
  PageContent page{0, make_page(5)};

  // 12-byte header + 100 pointers = 212 bytes; content area starts at 200.
  //
  page.write_cell_count(100);
  ASSERT_TRUE(page.write_cell_content_area(200).ok());

  EXPECT_EQ(*page.unallocated_region_start(), 212u);
  EXPECT_EQ(page.unallocated_region_size().status(),
            make_status(StatusCode::kCorruptUnallocatedRegion));

  ASSERT_TRUE(page.write_cell_content_area(212).ok());
  EXPECT_EQ(*page.unallocated_region_size(), 0u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, Freeblocks)
{
  std::shared_ptr<IoBuffer> buffer = make_page(13, litepage::kDatabaseHeaderSize);
  PageContent page = PageContent::for_page(1, buffer);

  // Freeblock offsets are absolute, even on page 1.
  //
  ASSERT_TRUE(page.write_freeblock(1000, u16{2000}, 16).ok());
  ASSERT_TRUE(page.write_freeblock(2000, litepage::None, 32).ok());
  page.write_first_freeblock(1000);

  EXPECT_THAT(std::vector<u8>(buffer->data() + 1000, buffer->data() + 1004),
              ::testing::ElementsAre(0x07, 0xd0, 0x00, 0x10));

  StatusOr<Freeblock> first = page.read_freeblock(1000);
  ASSERT_TRUE(first.ok()) << first.status();
  EXPECT_EQ(first->offset, 1000u);
  EXPECT_EQ(first->next, 2000u);
  EXPECT_EQ(first->size, 16u);

  StatusOr<std::vector<Freeblock>> chain = page.read_freeblock_list();
  ASSERT_TRUE(chain.ok()) << chain.status();
  ASSERT_EQ(chain->size(), 2u);
  EXPECT_EQ((*chain)[1].offset, 2000u);
  EXPECT_EQ((*chain)[1].next, 0u);
  EXPECT_EQ((*chain)[1].size, 32u);

  EXPECT_EQ(page.read_freeblock(4093).status(), make_status(StatusCode::kCorruptFreeblockOffset));
  EXPECT_TRUE(page.read_freeblock(4092).ok());
  EXPECT_EQ(page.write_freeblock(4094, litepage::None, 4),
            make_status(StatusCode::kCorruptFreeblockOffset));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, FreeblockChainMustIncrease)
{
  PageContent page{0, make_page(13)};

  ASSERT_TRUE(page.write_freeblock(3000, u16{2000}, 8).ok());
  ASSERT_TRUE(page.write_freeblock(2000, u16{3000}, 8).ok());
  page.write_first_freeblock(2000);

  EXPECT_EQ(page.read_freeblock_list().status(),
            make_status(StatusCode::kCorruptFreeblockOffset));

  page.write_first_freeblock(0);
  StatusOr<std::vector<Freeblock>> empty = page.read_freeblock_list();
  ASSERT_TRUE(empty.ok()) << empty.status();
  EXPECT_TRUE(empty->empty());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, RawAccessors)
{
  std::shared_ptr<IoBuffer> buffer = make_page(13, litepage::kDatabaseHeaderSize);
  PageContent page = PageContent::for_page(1, buffer);

  page.write_u32(20, 0x01020304);
  EXPECT_EQ(page.read_u32_absolute(120), 0x01020304u);
  EXPECT_EQ(page.read_u16(22), 0x0304u);
  EXPECT_EQ(page.read_u8(20), 0x01u);

  page.write_u16_absolute(4094, 0xabcd);
  EXPECT_EQ(page.read_u16_absolute(4094), 0xabcdu);

  page.write_u8_absolute(0, 0x53);
  EXPECT_EQ(buffer->data()[0], 0x53u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentDeathTest, RawAccessOutsidePagePanics)
{
  PageContent page = PageContent::for_page(1, make_page(13, litepage::kDatabaseHeaderSize));

  EXPECT_DEATH(page.read_u16_absolute(4095), "pos");
  EXPECT_DEATH(page.read_u32(3996), "pos");
  EXPECT_DEATH(page.write_u8_absolute(4096, 0), "pos");

  EXPECT_DEATH((PageContent{4090, IoBuffer::allocate(4096)}), "too small");
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST(PageContentTest, OverflowCells)
{
  PageContent page{0, make_page(13)};
  EXPECT_TRUE(page.overflow_cells().empty());

  page.overflow_cells().push_back(litepage::OverflowCell{2, {1, 2, 3}});

  const PageContent& const_page = page;
  ASSERT_EQ(const_page.overflow_cells().size(), 1u);
  EXPECT_EQ(const_page.overflow_cells()[0].index, 2u);
  EXPECT_THAT(const_page.overflow_cells()[0].payload, ::testing::ElementsAre(1, 2, 3));

  EXPECT_THAT(batt::to_string(page), ::testing::HasSubstr("TableLeaf"));
}

}  // namespace

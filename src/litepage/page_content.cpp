//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/page_content.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/assert.hpp>

#include <boost/endian/conversion.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Freeblock& t)
{
  return out << "Freeblock{.offset=" << t.offset << ", .next=" << t.next << ", .size=" << t.size
             << ",}";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class PageContent
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ PageContent PageContent::for_page(u32 page_number, std::shared_ptr<IoBuffer> buffer)
{
  BATT_CHECK_GE(page_number, kFirstPageNumber);

  const usize offset = (page_number == kFirstPageNumber) ? kDatabaseHeaderSize : 0;

  return PageContent{offset, std::move(buffer)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ PageContent::PageContent(usize offset, std::shared_ptr<IoBuffer> buffer)
    : offset_{offset}
    , buffer_{std::move(buffer)}
{
  BATT_CHECK_NOT_NULLPTR(this->buffer_);
  BATT_CHECK_LE(this->offset_ + kLeafPageHeaderSize, this->buffer_->size())
      << "page buffer is too small to hold a B-tree page header";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<PageType> PageContent::page_type() const
{
  return page_type_from_u8(this->read_u8(kBTreePageTypeOffset));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Optional<PageType> PageContent::maybe_page_type() const
{
  StatusOr<PageType> page_type = this->page_type();
  if (!page_type.ok()) {
    return None;
  }
  return *page_type;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_page_type(PageType page_type)
{
  this->write_u8(kBTreePageTypeOffset, static_cast<u8>(page_type));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> PageContent::is_leaf() const
{
  BATT_ASSIGN_OK_RESULT(PageType page_type, this->page_type());
  return page_type_is_leaf(page_type);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> PageContent::is_interior() const
{
  BATT_ASSIGN_OK_RESULT(PageType page_type, this->page_type());
  return page_type_is_interior(page_type);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> PageContent::is_table() const
{
  BATT_ASSIGN_OK_RESULT(PageType page_type, this->page_type());
  return page_type_is_table(page_type);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<bool> PageContent::is_index() const
{
  BATT_ASSIGN_OK_RESULT(PageType page_type, this->page_type());
  return page_type_is_index(page_type);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u16 PageContent::first_freeblock() const
{
  return this->read_u16(kBTreeFirstFreeblockOffset);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_first_freeblock(u16 offset)
{
  this->write_u16(kBTreeFirstFreeblockOffset, offset);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u16 PageContent::cell_count() const
{
  return this->read_u16(kBTreeCellCountOffset);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_cell_count(u16 count)
{
  this->write_u16(kBTreeCellCountOffset, count);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u32 PageContent::cell_content_area() const
{
  const u16 raw = this->read_u16(kBTreeCellContentAreaOffset);
  if (raw == 0) {
    return kMaxPageSize;
  }
  return raw;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PageContent::write_cell_content_area(u32 value)
{
  if (value == 0 || value > kMaxPageSize) {
    return Status{batt::StatusCode::kInvalidArgument};
  }
  this->write_u16(kBTreeCellContentAreaOffset,
                  (value == kMaxPageSize) ? u16{0} : static_cast<u16>(value));
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u8 PageContent::fragmented_bytes_count() const
{
  return this->read_u8(kBTreeFragmentedBytesOffset);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_fragmented_bytes_count(u8 count)
{
  this->write_u8(kBTreeFragmentedBytesOffset, count);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<u32> PageContent::rightmost_pointer() const
{
  BATT_ASSIGN_OK_RESULT(const bool interior, this->is_interior());
  if (!interior) {
    return make_status(StatusCode::kRightmostPointerNotApplicable);
  }
  return this->read_u32(kBTreeRightmostPointerOffset);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PageContent::write_rightmost_pointer(u32 page_number)
{
  BATT_ASSIGN_OK_RESULT(const bool interior, this->is_interior());
  if (!interior) {
    return make_status(StatusCode::kRightmostPointerNotApplicable);
  }
  this->write_u32(kBTreeRightmostPointerOffset, page_number);
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> PageContent::header_size() const
{
  BATT_ASSIGN_OK_RESULT(PageType page_type, this->page_type());
  return btree_header_size(page_type);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> PageContent::cell_pointer_array_offset() const
{
  BATT_ASSIGN_OK_RESULT(usize header_size, this->header_size());
  return this->offset_ + header_size;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> PageContent::unallocated_region_start() const
{
  BATT_ASSIGN_OK_RESULT(usize array_offset, this->cell_pointer_array_offset());
  return array_offset + this->cell_pointer_array_size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> PageContent::unallocated_region_size() const
{
  BATT_ASSIGN_OK_RESULT(usize region_start, this->unallocated_region_start());

  const usize region_end = this->cell_content_area();
  if (region_end < region_start) {
    LITEPAGE_VLOG(1) << "cell pointer array overlaps cell content area;"
                     << BATT_INSPECT(region_start) << BATT_INSPECT(region_end)
                     << BATT_INSPECT(this->cell_count());
    return make_status(StatusCode::kCorruptUnallocatedRegion);
  }
  return region_end - region_start;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<u16> PageContent::cell_pointer(usize index) const
{
  if (index >= this->cell_count()) {
    return Status{batt::StatusCode::kOutOfRange};
  }

  BATT_ASSIGN_OK_RESULT(usize array_offset, this->cell_pointer_array_offset());

  const usize slot = array_offset + index * kCellPointerSize;
  if (slot + kCellPointerSize > this->page_size()) {
    return make_status(StatusCode::kCorruptCellPointer);
  }

  const u16 cell_offset = this->read_u16_absolute(slot);
  if (cell_offset >= this->page_size()) {
    return make_status(StatusCode::kCorruptCellPointer);
  }
  return cell_offset;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PageContent::write_cell_pointer(usize index, u16 cell_offset)
{
  if (index >= this->cell_count() || cell_offset >= this->page_size()) {
    return Status{batt::StatusCode::kOutOfRange};
  }

  BATT_ASSIGN_OK_RESULT(usize array_offset, this->cell_pointer_array_offset());

  const usize slot = array_offset + index * kCellPointerSize;
  if (slot + kCellPointerSize > this->page_size()) {
    return make_status(StatusCode::kCorruptCellPointer);
  }

  this->write_u16_absolute(slot, cell_offset);
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Freeblock> PageContent::read_freeblock(u16 offset) const
{
  if (usize{offset} + kFreeblockRecordSize > this->page_size()) {
    return make_status(StatusCode::kCorruptFreeblockOffset);
  }
  return Freeblock{offset, this->read_u16_absolute(offset), this->read_u16_absolute(offset + 2)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PageContent::write_freeblock(u16 offset, Optional<u16> next, u16 size)
{
  if (usize{offset} + kFreeblockRecordSize > this->page_size()) {
    return make_status(StatusCode::kCorruptFreeblockOffset);
  }
  this->write_u16_absolute(offset, next.value_or(0));
  this->write_u16_absolute(offset + 2, size);
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::vector<Freeblock>> PageContent::read_freeblock_list() const
{
  std::vector<Freeblock> freeblocks;

  u16 next = this->first_freeblock();
  while (next != 0) {
    BATT_ASSIGN_OK_RESULT(Freeblock freeblock, this->read_freeblock(next));

    if (freeblock.next != 0 && freeblock.next <= freeblock.offset) {
      return make_status(StatusCode::kCorruptFreeblockOffset);
    }
    next = freeblock.next;
    freeblocks.emplace_back(freeblock);
  }

  return freeblocks;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
const u8* PageContent::absolute_ptr(usize pos, usize len) const
{
  BATT_CHECK_LE(pos + len, this->buffer_->size()) << BATT_INSPECT(pos) << BATT_INSPECT(len);

  return this->buffer_->data() + pos;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u8* PageContent::absolute_ptr(usize pos, usize len)
{
  BATT_CHECK_LE(pos + len, this->buffer_->size()) << BATT_INSPECT(pos) << BATT_INSPECT(len);

  return this->buffer_->data() + pos;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u8 PageContent::read_u8(usize pos) const
{
  return this->read_u8_absolute(this->offset_ + pos);
}

u16 PageContent::read_u16(usize pos) const
{
  return this->read_u16_absolute(this->offset_ + pos);
}

u32 PageContent::read_u32(usize pos) const
{
  return this->read_u32_absolute(this->offset_ + pos);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_u8(usize pos, u8 value)
{
  this->write_u8_absolute(this->offset_ + pos, value);
}

void PageContent::write_u16(usize pos, u16 value)
{
  this->write_u16_absolute(this->offset_ + pos, value);
}

void PageContent::write_u32(usize pos, u32 value)
{
  this->write_u32_absolute(this->offset_ + pos, value);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u8 PageContent::read_u8_absolute(usize pos) const
{
  return *this->absolute_ptr(pos, sizeof(u8));
}

u16 PageContent::read_u16_absolute(usize pos) const
{
  return boost::endian::load_big_u16(this->absolute_ptr(pos, sizeof(u16)));
}

u32 PageContent::read_u32_absolute(usize pos) const
{
  return boost::endian::load_big_u32(this->absolute_ptr(pos, sizeof(u32)));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PageContent::write_u8_absolute(usize pos, u8 value)
{
  *this->absolute_ptr(pos, sizeof(u8)) = value;
}

void PageContent::write_u16_absolute(usize pos, u16 value)
{
  boost::endian::store_big_u16(this->absolute_ptr(pos, sizeof(u16)), value);
}

void PageContent::write_u32_absolute(usize pos, u32 value)
{
  boost::endian::store_big_u32(this->absolute_ptr(pos, sizeof(u32)), value);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const PageContent& t)
{
  out << "PageContent{.offset=" << t.offset() << ", .page_size=" << t.page_size() << ", .type=";
  Optional<PageType> page_type = t.maybe_page_type();
  if (page_type) {
    out << *page_type;
  } else {
    out << "(corrupt:" << (int)t.read_u8(kBTreePageTypeOffset) << ")";
  }
  return out << ", .cell_count=" << t.cell_count()
             << ", .cell_content_area=" << t.cell_content_area()
             << ", .overflow_cells=" << t.overflow_cells().size() << ",}";
}

}  // namespace litepage

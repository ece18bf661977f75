//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_PAGE_CONTENT_HPP
#define LITEPAGE_PAGE_CONTENT_HPP

#include <litepage/config.hpp>
#include <litepage/int_types.hpp>
#include <litepage/io_buffer.hpp>
#include <litepage/optional.hpp>
#include <litepage/page_type.hpp>
#include <litepage/status.hpp>

#include <memory>
#include <ostream>
#include <vector>

namespace litepage {

// A cell that did not fit on its page during a B-tree mutation and is waiting to be placed.
//
struct OverflowCell {
  // The cell's logical position in the page's cell pointer array.
  //
  usize index;

  std::vector<u8> payload;
};

// One record in a page's freeblock chain.  Offsets are absolute within the page.
//
struct Freeblock {
  u16 offset;

  // Absolute offset of the next freeblock in the chain, or 0 at the end of the chain.
  //
  u16 next;

  // Size of this freeblock in bytes, including the 4-byte record itself.
  //
  u16 size;
};

std::ostream& operator<<(std::ostream& out, const Freeblock& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Structured access to the B-tree page held in a page-sized buffer.
//
// The page header starts at `offset()`: 0 for every page except page 1, where the first 100 bytes
// hold the database file header.  Header field accessors (the "relative" addressing mode) are
// relative to that offset.  Cell pointers and freeblock offsets are absolute positions within the
// buffer, and the `*_absolute` accessors address the buffer directly.
//
// All multi-byte fields are big-endian.
//
// Reads of the header fields trust the bytes in the buffer; any value derived from the page type
// byte or from cell/freeblock offsets is validated and reported as a "corrupt database" status when
// it is inconsistent with the page.  Raw field access outside the buffer is a fatal error.
//
// Each PageContent shares ownership of the buffer; mutating a page while it is attached to an
// outstanding I/O operation is not allowed.
//
class PageContent
{
 public:
  // Returns a PageContent for page number `page_number` (1-based) held in `buffer`.
  //
  static PageContent for_page(u32 page_number, std::shared_ptr<IoBuffer> buffer);

  explicit PageContent(usize offset, std::shared_ptr<IoBuffer> buffer);

  usize offset() const
  {
    return this->offset_;
  }

  const std::shared_ptr<IoBuffer>& buffer() const
  {
    return this->buffer_;
  }

  usize page_size() const
  {
    return this->buffer_->size();
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Page type.

  // Returns StatusCode::kCorruptPageType unless the type byte is 2, 5, 10, or 13.
  //
  StatusOr<PageType> page_type() const;

  Optional<PageType> maybe_page_type() const;

  void write_page_type(PageType page_type);

  StatusOr<bool> is_leaf() const;

  StatusOr<bool> is_interior() const;

  StatusOr<bool> is_table() const;

  StatusOr<bool> is_index() const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Header fields.

  u16 first_freeblock() const;

  void write_first_freeblock(u16 offset);

  u16 cell_count() const;

  void write_cell_count(u16 count);

  // Returns the start of the cell content area; the raw field value 0 means 65536.
  //
  u32 cell_content_area() const;

  // `value` must be in [1, 65536]; 65536 is stored as 0.  Returns batt::StatusCode::kInvalidArgument
  // otherwise.
  //
  Status write_cell_content_area(u32 value);

  u8 fragmented_bytes_count() const;

  void write_fragmented_bytes_count(u8 count);

  // Returns the rightmost child page number.  Only interior pages have this field; for leaf pages
  // this returns StatusCode::kRightmostPointerNotApplicable.
  //
  StatusOr<u32> rightmost_pointer() const;

  Status write_rightmost_pointer(u32 page_number);

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Layout.

  // 12 for interior pages, 8 for leaf pages.
  //
  StatusOr<usize> header_size() const;

  // Absolute offset of the first cell pointer.
  //
  StatusOr<usize> cell_pointer_array_offset() const;

  usize cell_pointer_array_size() const
  {
    return usize{this->cell_count()} * kCellPointerSize;
  }

  // Absolute offset of the first byte after the cell pointer array.
  //
  StatusOr<usize> unallocated_region_start() const;

  // Number of bytes between the end of the cell pointer array and the start of the cell content
  // area.  Returns StatusCode::kCorruptUnallocatedRegion if the two overlap.
  //
  StatusOr<usize> unallocated_region_size() const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Cell pointers.

  // Returns the absolute offset of cell `index`.  Fails with batt::StatusCode::kOutOfRange if
  // `index >= cell_count()`, or StatusCode::kCorruptCellPointer if the pointer (or the array slot
  // holding it) lies outside the page.
  //
  StatusOr<u16> cell_pointer(usize index) const;

  // Fails with batt::StatusCode::kOutOfRange if `index >= cell_count()` or `cell_offset` is not
  // inside the page.
  //
  Status write_cell_pointer(usize index, u16 cell_offset);

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Freeblocks.

  // Reads the freeblock record at absolute offset `offset`.  Returns
  // StatusCode::kCorruptFreeblockOffset if the record does not fit in the page.
  //
  StatusOr<Freeblock> read_freeblock(u16 offset) const;

  Status write_freeblock(u16 offset, Optional<u16> next, u16 size);

  // Walks the freeblock chain from `first_freeblock()`.  SQLite keeps the chain in increasing
  // offset order, so a chain that does not strictly increase is reported as
  // StatusCode::kCorruptFreeblockOffset.
  //
  StatusOr<std::vector<Freeblock>> read_freeblock_list() const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // Raw field access (panics if out of bounds).

  u8 read_u8(usize pos) const;
  u16 read_u16(usize pos) const;
  u32 read_u32(usize pos) const;

  void write_u8(usize pos, u8 value);
  void write_u16(usize pos, u16 value);
  void write_u32(usize pos, u32 value);

  u8 read_u8_absolute(usize pos) const;
  u16 read_u16_absolute(usize pos) const;
  u32 read_u32_absolute(usize pos) const;

  void write_u8_absolute(usize pos, u8 value);
  void write_u16_absolute(usize pos, u16 value);
  void write_u32_absolute(usize pos, u32 value);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  std::vector<OverflowCell>& overflow_cells()
  {
    return this->overflow_cells_;
  }

  const std::vector<OverflowCell>& overflow_cells() const
  {
    return this->overflow_cells_;
  }

 private:
  const u8* absolute_ptr(usize pos, usize len) const;

  u8* absolute_ptr(usize pos, usize len);

  usize offset_;

  std::shared_ptr<IoBuffer> buffer_;

  std::vector<OverflowCell> overflow_cells_;
};

std::ostream& operator<<(std::ostream& out, const PageContent& t);

}  // namespace litepage

#endif  // LITEPAGE_PAGE_CONTENT_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_CONFIG_HPP
#define LITEPAGE_CONFIG_HPP

#include <litepage/int_types.hpp>

#include <batteries/static_assert.hpp>

namespace litepage {

//+++++++++++-+-+--+----- --- -- -  -  -   -
#ifdef __linux__
#define LITEPAGE_PLATFORM_IS_LINUX 1
#else
#undef LITEPAGE_PLATFORM_IS_LINUX
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

#ifdef NDEBUG
constexpr bool kDebugBuild = false;
#else
constexpr bool kDebugBuild = true;
#endif

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Database file layout.

// The database file header occupies the first bytes of page 1; the B-tree page header of page 1
// starts immediately after it.
//
constexpr usize kDatabaseHeaderSize = 100;

// Page numbers are 1-based; this is the page that carries the database file header.
//
constexpr u32 kFirstPageNumber = 1;

// Bounds and default for the database page size (bytes).
//
constexpr u32 kMinPageSize = 512;
constexpr u32 kMaxPageSize = 65536;
constexpr u32 kDefaultPageSize = 4096;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// B-tree page header.
//
//  +--------+-----------------+-------------+-------------------+--------+-----------------+
//  | type   | first freeblock | cell count  | cell content area | frag.  | rightmost child |
//  |        |                 |             |                   | bytes  | (interior only) |
//  +--------+-----------------+-------------+-------------------+--------+-----------------+
//  0        1                 3             5                   7        8                12
//
constexpr usize kBTreePageTypeOffset = 0;
constexpr usize kBTreeFirstFreeblockOffset = 1;
constexpr usize kBTreeCellCountOffset = 3;
constexpr usize kBTreeCellContentAreaOffset = 5;
constexpr usize kBTreeFragmentedBytesOffset = 7;
constexpr usize kBTreeRightmostPointerOffset = 8;

constexpr usize kInteriorPageHeaderSize = 12;
constexpr usize kLeafPageHeaderSize = 8;

// Each entry of the cell pointer array is a big-endian u16.
//
constexpr usize kCellPointerSize = 2;

// A freeblock starts with {next: big_u16, size: big_u16}.
//
constexpr usize kFreeblockRecordSize = 4;

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// The maximum number of bytes in an encoded varint.
//
constexpr usize kMaxVarintSize = 9;

// The fixed page size of the in-memory file backend.  This is independent of the database page
// size; it is just the granularity of the sparse page map.
//
constexpr usize kMemoryFilePageSize = 4096;

BATT_STATIC_ASSERT_EQ(kInteriorPageHeaderSize, kBTreeRightmostPointerOffset + 4);
BATT_STATIC_ASSERT_EQ(kLeafPageHeaderSize, kBTreeRightmostPointerOffset);

}  // namespace litepage

#endif  // LITEPAGE_CONFIG_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_PAGE_TYPE_HPP
#define LITEPAGE_PAGE_TYPE_HPP

#include <litepage/int_types.hpp>
#include <litepage/status.hpp>

#include <ostream>

namespace litepage {

// The B-tree page type byte at the start of every B-tree page header.
//
enum struct PageType : u8 {
  kIndexInterior = 2,
  kTableInterior = 5,
  kIndexLeaf = 10,
  kTableLeaf = 13,
};

std::ostream& operator<<(std::ostream& out, PageType t);

// Returns StatusCode::kCorruptPageType if `value` is not one of the four page type codes.
//
StatusOr<PageType> page_type_from_u8(u8 value);

bool page_type_is_interior(PageType t);

bool page_type_is_leaf(PageType t);

bool page_type_is_table(PageType t);

bool page_type_is_index(PageType t);

// Returns 12 for interior pages (which carry a rightmost child pointer) and 8 for leaf pages.
//
usize btree_header_size(PageType t);

}  // namespace litepage

#endif  // LITEPAGE_PAGE_TYPE_HPP

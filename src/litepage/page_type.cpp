//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/page_type.hpp>
//

#include <litepage/config.hpp>

#include <batteries/assert.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, PageType t)
{
  switch (t) {
    case PageType::kIndexInterior:
      return out << "IndexInterior";
    case PageType::kTableInterior:
      return out << "TableInterior";
    case PageType::kIndexLeaf:
      return out << "IndexLeaf";
    case PageType::kTableLeaf:
      return out << "TableLeaf";
  }
  return out << "(bad value:" << (int)t << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<PageType> page_type_from_u8(u8 value)
{
  switch (value) {
    case static_cast<u8>(PageType::kIndexInterior):
      return PageType::kIndexInterior;
    case static_cast<u8>(PageType::kTableInterior):
      return PageType::kTableInterior;
    case static_cast<u8>(PageType::kIndexLeaf):
      return PageType::kIndexLeaf;
    case static_cast<u8>(PageType::kTableLeaf):
      return PageType::kTableLeaf;
    default:
      break;
  }
  return make_status(StatusCode::kCorruptPageType);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool page_type_is_interior(PageType t)
{
  switch (t) {
    case PageType::kIndexInterior:
    case PageType::kTableInterior:
      return true;
    case PageType::kIndexLeaf:
    case PageType::kTableLeaf:
      return false;
  }
  BATT_PANIC() << "bad PageType: " << (int)t;
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool page_type_is_leaf(PageType t)
{
  return !page_type_is_interior(t);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool page_type_is_table(PageType t)
{
  switch (t) {
    case PageType::kTableInterior:
    case PageType::kTableLeaf:
      return true;
    case PageType::kIndexInterior:
    case PageType::kIndexLeaf:
      return false;
  }
  BATT_PANIC() << "bad PageType: " << (int)t;
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool page_type_is_index(PageType t)
{
  return !page_type_is_table(t);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize btree_header_size(PageType t)
{
  return page_type_is_interior(t) ? kInteriorPageHeaderSize : kLeafPageHeaderSize;
}

}  // namespace litepage

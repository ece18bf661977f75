//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/page_size.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/math.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Optional<PageSize> PageSize::from_u32(u32 size)
{
  if (size < kMinPageSize || size > kMaxPageSize) {
    return None;
  }
  if (batt::bit_count(size) != 1) {
    return None;
  }
  if (size == kMaxPageSize) {
    return PageSize{kMaxPageSizeRaw};
  }
  return PageSize{static_cast<u16>(size)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<PageSize> PageSize::from_header_u16(u16 raw)
{
  if (raw == kMaxPageSizeRaw) {
    return PageSize{kMaxPageSizeRaw};
  }

  Optional<PageSize> page_size = PageSize::from_u32(raw);
  if (!page_size) {
    LITEPAGE_VLOG(1) << "invalid page size in database header;" << BATT_INSPECT(raw);
    return make_status(StatusCode::kCorruptPageSize);
  }
  return *page_size;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const PageSize& t)
{
  return out << "PageSize{" << t.get() << "}";
}

}  // namespace litepage

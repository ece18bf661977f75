//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_PAGE_SIZE_HPP
#define LITEPAGE_PAGE_SIZE_HPP

#include <litepage/config.hpp>
#include <litepage/int_types.hpp>
#include <litepage/optional.hpp>
#include <litepage/status.hpp>

#include <ostream>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The database page size: a power of two in [kMinPageSize, kMaxPageSize].
//
// Stored in the 16-bit big-endian form used in the database header.  65536 does not fit in 16 bits,
// so it is represented by the raw value 1.
//
class PageSize
{
 public:
  static constexpr u16 kMaxPageSizeRaw = 1;

  // Returns None unless `size` is a power of two in [kMinPageSize, kMaxPageSize].
  //
  static Optional<PageSize> from_u32(u32 size);

  // Parses the raw page size field from a database header; fails with StatusCode::kCorruptPageSize
  // if it is not a valid encoding.
  //
  static StatusOr<PageSize> from_header_u16(u16 raw);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  PageSize() noexcept : raw_{static_cast<u16>(kDefaultPageSize)}
  {
  }

  u32 get() const
  {
    const u16 raw = this->raw_;
    return (raw == kMaxPageSizeRaw) ? kMaxPageSize : raw;
  }

  u16 get_raw() const
  {
    return this->raw_;
  }

 private:
  explicit PageSize(u16 raw) noexcept : raw_{raw}
  {
  }

  big_u16 raw_;
};

inline bool operator==(const PageSize& l, const PageSize& r)
{
  return l.get_raw() == r.get_raw();
}

inline bool operator!=(const PageSize& l, const PageSize& r)
{
  return !(l == r);
}

std::ostream& operator<<(std::ostream& out, const PageSize& t);

}  // namespace litepage

#endif  // LITEPAGE_PAGE_SIZE_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_OPEN_FLAGS_HPP
#define LITEPAGE_OPEN_FLAGS_HPP

#include <litepage/int_types.hpp>

#include <ostream>

namespace litepage {

/** \brief Combinable options passed to `IO::open_file`.
 *
 * The default value is `OpenFlags::kCreate`.
 */
class OpenFlags
{
 public:
  static const OpenFlags kNone;
  static const OpenFlags kCreate;
  static const OpenFlags kReadOnly;

  constexpr OpenFlags() noexcept : bits_{0b01}
  {
  }

  constexpr explicit OpenFlags(i32 bits) noexcept : bits_{bits}
  {
  }

  constexpr i32 bits() const noexcept
  {
    return this->bits_;
  }

  /** \brief Returns true iff every bit set in `other` is also set in this.  Note that this means
   * all flag sets contain `kNone`.
   */
  constexpr bool contains(OpenFlags other) const noexcept
  {
    return (this->bits_ & other.bits_) == other.bits_;
  }

  constexpr OpenFlags operator|(OpenFlags other) const noexcept
  {
    return OpenFlags{this->bits_ | other.bits_};
  }

  constexpr OpenFlags operator&(OpenFlags other) const noexcept
  {
    return OpenFlags{this->bits_ & other.bits_};
  }

  OpenFlags& operator|=(OpenFlags other) noexcept
  {
    this->bits_ |= other.bits_;
    return *this;
  }

  constexpr bool operator==(OpenFlags other) const noexcept
  {
    return this->bits_ == other.bits_;
  }

  constexpr bool operator!=(OpenFlags other) const noexcept
  {
    return !(*this == other);
  }

 private:
  i32 bits_;
};

inline constexpr OpenFlags OpenFlags::kNone{0b00};
inline constexpr OpenFlags OpenFlags::kCreate{0b01};
inline constexpr OpenFlags OpenFlags::kReadOnly{0b10};

std::ostream& operator<<(std::ostream& out, OpenFlags t);

}  // namespace litepage

#endif  // LITEPAGE_OPEN_FLAGS_HPP

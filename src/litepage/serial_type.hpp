//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_SERIAL_TYPE_HPP
#define LITEPAGE_SERIAL_TYPE_HPP

#include <litepage/int_types.hpp>
#include <litepage/status.hpp>

#include <batteries/assert.hpp>

#include <ostream>

namespace litepage {

// The storage class of one column value in a record, as encoded in the record header.
//
enum struct SerialTypeKind {
  kNull,
  kI8,
  kI16,
  kI24,
  kI32,
  kI48,
  kI64,
  kF64,
  kConstInt0,
  kConstInt1,
  kBlob,
  kText,
};

std::ostream& operator<<(std::ostream& out, SerialTypeKind t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A record header serial type code.
//
//  - 0..9: fixed-size types (see SerialTypeKind)
//  - 10, 11: reserved; never valid
//  - even N >= 12: blob of (N - 12) / 2 bytes
//  - odd N >= 13: text of (N - 13) / 2 bytes
//
class SerialType
{
 public:
  static constexpr u64 kBlobBase = 12;
  static constexpr u64 kTextBase = 13;

  // The longest blob or text payload whose serial type code fits in a u64.
  //
  static constexpr u64 kMaxPayloadLength = (~u64{0} - kTextBase) / 2;

  // Returns true iff `n` is a valid serial type code.
  //
  static constexpr bool is_valid(u64 n)
  {
    return n != 10 && n != 11;
  }

  // Returns StatusCode::kCorruptSerialType if `n` is 10 or 11.
  //
  static StatusOr<SerialType> from_u64(u64 n);

  static SerialType null()
  {
    return SerialType{0};
  }

  static SerialType i8()
  {
    return SerialType{1};
  }

  static SerialType i16()
  {
    return SerialType{2};
  }

  static SerialType i24()
  {
    return SerialType{3};
  }

  static SerialType i32()
  {
    return SerialType{4};
  }

  static SerialType i48()
  {
    return SerialType{5};
  }

  static SerialType i64()
  {
    return SerialType{6};
  }

  static SerialType f64()
  {
    return SerialType{7};
  }

  static SerialType const_int0()
  {
    return SerialType{8};
  }

  static SerialType const_int1()
  {
    return SerialType{9};
  }

  static SerialType blob(u64 len)
  {
    BATT_CHECK_LE(len, kMaxPayloadLength);
    return SerialType{kBlobBase + len * 2};
  }

  static SerialType text(u64 len)
  {
    BATT_CHECK_LE(len, kMaxPayloadLength);
    return SerialType{kTextBase + len * 2};
  }

  // Returns the smallest integer serial type that can hold `value`; 0 and 1 map to the constant
  // types, which have no payload.
  //
  static SerialType for_integer(i64 value);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  u64 value() const
  {
    return this->value_;
  }

  SerialTypeKind kind() const;

  // Returns the size in bytes of the value's payload in the record body.
  //
  usize size() const;

 private:
  explicit SerialType(u64 value) noexcept : value_{value}
  {
  }

  u64 value_;
};

inline bool operator==(const SerialType& l, const SerialType& r)
{
  return l.value() == r.value();
}

inline bool operator!=(const SerialType& l, const SerialType& r)
{
  return !(l == r);
}

std::ostream& operator<<(std::ostream& out, const SerialType& t);

}  // namespace litepage

#endif  // LITEPAGE_SERIAL_TYPE_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

// varint.hpp : SQLite-format variable-length integers (big-endian, 1..9 bytes)

#pragma once
#ifndef LITEPAGE_VARINT_HPP
#define LITEPAGE_VARINT_HPP

#include <litepage/buffer.hpp>
#include <litepage/config.hpp>
#include <litepage/int_types.hpp>
#include <litepage/optional.hpp>
#include <litepage/status.hpp>

#include <batteries/static_assert.hpp>

#include <limits>
#include <tuple>

namespace litepage {

// Values with any of these bits set always use the 9-byte encoding.
//
constexpr u64 kVarintNineByteMask = u64{0xff} << 56;

/** \brief Returns the number of bytes `write_varint` emits for `n`.
 */
inline constexpr usize varint_len(u64 n)
{
  if ((n & kVarintNineByteMask) != 0) {
    return kMaxVarintSize;
  }
  return (n == 0) ? 1 : (64 - __builtin_clzll(n) + 6) / 7;
}

BATT_STATIC_ASSERT_EQ(varint_len(0), 1);
BATT_STATIC_ASSERT_EQ(varint_len((u64{1} << 56) - 1), 8);
BATT_STATIC_ASSERT_EQ(varint_len(u64{1} << 56), 9);
BATT_STATIC_ASSERT_EQ(varint_len(std::numeric_limits<u64>::max()), 9);

// Writes the varint encoding of `n` to the byte range [first, last).  Returns a pointer to the byte
// after the encoding, or nullptr if the range is too small.
//
u8* write_varint(u8* first, u8* last, u64 n);

/** \brief (Convenience) Writes `n` to the buffer `dst`, returning the remaining portion of `dst` if
 * successful or None if there is not enough space.
 */
inline Optional<MutableBuffer> write_varint(const MutableBuffer& dst, u64 n)
{
  u8* const first = static_cast<u8*>(dst.data());
  u8* const last = first + dst.size();
  u8* const rest = write_varint(first, last, n);
  if (rest) {
    return MutableBuffer{rest, static_cast<usize>(last - rest)};
  }
  return None;
}

// Decodes a varint from the front of [first, last), returning the value and the number of bytes it
// occupied.
//
// Fails with StatusCode::kCorruptVarintTruncated if the range ends before the encoding does, or
// StatusCode::kCorruptVarintOverflow if the decoded value does not fit in 64 bits.
//
StatusOr<std::tuple<u64, usize>> read_varint(const u8* first, const u8* last);

/** \brief (Convenience) Decodes a varint from the front of `*src`, advancing `*src` past it on
 * success.  `*src` is unchanged on failure.
 */
inline StatusOr<u64> read_varint(ConstBuffer* src)
{
  const u8* const first = static_cast<const u8*>(src->data());
  const u8* const last = first + src->size();

  StatusOr<std::tuple<u64, usize>> result = read_varint(first, last);
  BATT_REQUIRE_OK(result);

  auto [n, len] = *result;
  *src += len;
  return n;
}

}  // namespace litepage

#endif  // LITEPAGE_VARINT_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/varint.hpp>
//

#include <batteries/assert.hpp>

namespace litepage {

namespace {
constexpr u64 kLowBitsMask = 0b01111111;
constexpr u8 kHighBitMask = 0b10000000;
// Bits that must be clear in the 56-bit accumulator before the ninth byte is shifted in.
//
constexpr u64 kOverflowMask = ~u64{0} << 56;
}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
u8* write_varint(u8* first, u8* last, u64 n)
{
  const usize bytes_required = varint_len(n);
  if (static_cast<usize>(last - first) < bytes_required) {
    return nullptr;
  }

  BATT_CHECK_LE(bytes_required, kMaxVarintSize);

  // Fill from the back: the final byte carries the lowest-order bits.
  //
  u8* const end = first + bytes_required;
  u8* next = end;

  if (bytes_required == kMaxVarintSize) {
    --next;
    *next = static_cast<u8>(n & 0xff);
    n >>= 8;
    while (next != first) {
      --next;
      *next = static_cast<u8>((n & kLowBitsMask) | kHighBitMask);
      n >>= 7;
    }
  } else {
    --next;
    *next = static_cast<u8>(n & kLowBitsMask);
    n >>= 7;
    while (next != first) {
      --next;
      *next = static_cast<u8>((n & kLowBitsMask) | kHighBitMask);
      n >>= 7;
    }
  }

  BATT_CHECK_EQ(n, 0u) << "varint_len calculation was wrong!" << BATT_INSPECT(bytes_required);

  return end;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::tuple<u64, usize>> read_varint(const u8* first, const u8* last)
{
  u64 n = 0;
  for (usize i = 0; i < kMaxVarintSize - 1; ++i) {
    if (first + i == last) {
      return make_status(StatusCode::kCorruptVarintTruncated);
    }
    const u8 next_byte = first[i];

    n = (n << 7) | (next_byte & kLowBitsMask);
    if (!(next_byte & kHighBitMask)) {
      return std::make_tuple(n, i + 1);
    }
  }

  // All eight leading bytes had the continuation bit set; the ninth contributes a full 8 bits.
  //
  if (first + (kMaxVarintSize - 1) == last) {
    return make_status(StatusCode::kCorruptVarintTruncated);
  }
  if ((n & kOverflowMask) != 0) {
    return make_status(StatusCode::kCorruptVarintOverflow);
  }
  n = (n << 8) | first[kMaxVarintSize - 1];

  return std::make_tuple(n, kMaxVarintSize);
}

}  // namespace litepage

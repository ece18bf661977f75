//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_BUFFER_HPP
#define LITEPAGE_BUFFER_HPP

#include <litepage/int_types.hpp>

#include <batteries/buffer.hpp>

namespace litepage {

using batt::ConstBuffer;
using batt::MutableBuffer;

// Returns the distance, in bytes, from `begin` to `end`.  If `end` is less than `begin`, the result
// is negative.
//
inline isize byte_distance(const void* begin, const void* end)
{
  return static_cast<const u8*>(end) - static_cast<const u8*>(begin);
}

}  // namespace litepage

#endif  // LITEPAGE_BUFFER_HPP

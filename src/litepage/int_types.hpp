//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_INT_TYPES_HPP
#define LITEPAGE_INT_TYPES_HPP

#include <batteries/int_types.hpp>

#include <boost/endian/arithmetic.hpp>

namespace litepage {

namespace int_types {

using namespace batt::int_types;

using big_u8 = boost::endian::big_uint8_t;
using big_u16 = boost::endian::big_uint16_t;
using big_u24 = boost::endian::big_uint24_t;
using big_u32 = boost::endian::big_uint32_t;
using big_u48 = boost::endian::big_uint48_t;
using big_u64 = boost::endian::big_uint64_t;

using big_i8 = boost::endian::big_int8_t;
using big_i16 = boost::endian::big_int16_t;
using big_i24 = boost::endian::big_int24_t;
using big_i32 = boost::endian::big_int32_t;
using big_i48 = boost::endian::big_int48_t;
using big_i64 = boost::endian::big_int64_t;

}  // namespace int_types

using namespace int_types;

}  // namespace litepage

#endif  // LITEPAGE_INT_TYPES_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_RECORD_HEADER_HPP
#define LITEPAGE_RECORD_HEADER_HPP

#include <litepage/buffer.hpp>
#include <litepage/int_types.hpp>
#include <litepage/serial_type.hpp>
#include <litepage/status.hpp>

#include <ostream>
#include <vector>

namespace litepage {

// The header of a record: a varint giving the header's total size in bytes (including that varint),
// followed by one serial type varint per column.
//
struct RecordHeader {
  u64 header_size;
  std::vector<SerialType> serial_types;

  // Returns the total payload size of the record body described by this header.
  //
  usize body_size() const;
};

std::ostream& operator<<(std::ostream& out, const RecordHeader& t);

// Parses a record header from the front of `src`.
//
// Returns StatusCode::kCorruptRecordHeader if the header size is inconsistent with the bytes present
// or a serial type varint runs past the end of the header, and StatusCode::kCorruptSerialType if a
// column has a reserved serial type.
//
StatusOr<RecordHeader> parse_record_header(const ConstBuffer& src);

// Returns the number of bytes `pack_record_header` writes for `serial_types`.
//
usize packed_sizeof_record_header(const std::vector<SerialType>& serial_types);

// Writes a record header for `serial_types` to the front of `dst`, returning the number of bytes
// written, or StatusCode::kRecordHeaderBufferTooSmall if `dst` is too small.
//
StatusOr<usize> pack_record_header(const std::vector<SerialType>& serial_types,
                                   const MutableBuffer& dst);

}  // namespace litepage

#endif  // LITEPAGE_RECORD_HEADER_HPP

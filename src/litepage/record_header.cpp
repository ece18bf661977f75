//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/record_header.hpp>
//

#include <litepage/varint.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize RecordHeader::body_size() const
{
  usize total = 0;
  for (const SerialType& serial_type : this->serial_types) {
    total += serial_type.size();
  }
  return total;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const RecordHeader& t)
{
  return out << "RecordHeader{.header_size=" << t.header_size
             << ", .serial_types=" << batt::dump_range(t.serial_types) << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<RecordHeader> parse_record_header(const ConstBuffer& src)
{
  const u8* const first = static_cast<const u8*>(src.data());
  const u8* const last = first + src.size();

  StatusOr<std::tuple<u64, usize>> size_varint = read_varint(first, last);
  if (!size_varint.ok()) {
    return make_status(StatusCode::kCorruptRecordHeader);
  }

  RecordHeader header;
  usize offset = 0;
  std::tie(header.header_size, offset) = *size_varint;

  if (header.header_size < offset || header.header_size > src.size()) {
    return make_status(StatusCode::kCorruptRecordHeader);
  }

  const u8* const header_end = first + header.header_size;
  while (first + offset < header_end) {
    StatusOr<std::tuple<u64, usize>> next = read_varint(first + offset, header_end);
    if (!next.ok()) {
      return make_status(StatusCode::kCorruptRecordHeader);
    }

    auto [code, len] = *next;
    BATT_ASSIGN_OK_RESULT(SerialType serial_type, SerialType::from_u64(code));

    header.serial_types.emplace_back(serial_type);
    offset += len;
  }

  return header;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize packed_sizeof_record_header(const std::vector<SerialType>& serial_types)
{
  usize types_size = 0;
  for (const SerialType& serial_type : serial_types) {
    types_size += varint_len(serial_type.value());
  }

  // The size varint counts itself, so its own length must be found by iteration.
  //
  usize size_len = 1;
  while (varint_len(types_size + size_len) != size_len) {
    size_len = varint_len(types_size + size_len);
  }

  return types_size + size_len;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> pack_record_header(const std::vector<SerialType>& serial_types,
                                   const MutableBuffer& dst)
{
  const usize header_size = packed_sizeof_record_header(serial_types);
  if (dst.size() < header_size) {
    return make_status(StatusCode::kRecordHeaderBufferTooSmall);
  }

  u8* const first = static_cast<u8*>(dst.data());
  u8* const last = first + header_size;

  u8* next = write_varint(first, last, header_size);
  BATT_CHECK_NOT_NULLPTR(next);

  for (const SerialType& serial_type : serial_types) {
    next = write_varint(next, last, serial_type.value());
    BATT_CHECK_NOT_NULLPTR(next);
  }
  BATT_CHECK_EQ(next, last);

  return header_size;
}

}  // namespace litepage

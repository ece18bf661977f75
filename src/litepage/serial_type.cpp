//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/serial_type.hpp>
//

#include <batteries/assert.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, SerialTypeKind t)
{
  switch (t) {
    case SerialTypeKind::kNull:
      return out << "Null";
    case SerialTypeKind::kI8:
      return out << "I8";
    case SerialTypeKind::kI16:
      return out << "I16";
    case SerialTypeKind::kI24:
      return out << "I24";
    case SerialTypeKind::kI32:
      return out << "I32";
    case SerialTypeKind::kI48:
      return out << "I48";
    case SerialTypeKind::kI64:
      return out << "I64";
    case SerialTypeKind::kF64:
      return out << "F64";
    case SerialTypeKind::kConstInt0:
      return out << "ConstInt0";
    case SerialTypeKind::kConstInt1:
      return out << "ConstInt1";
    case SerialTypeKind::kBlob:
      return out << "Blob";
    case SerialTypeKind::kText:
      return out << "Text";
  }
  return out << "(bad value:" << (int)t << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ StatusOr<SerialType> SerialType::from_u64(u64 n)
{
  if (!SerialType::is_valid(n)) {
    return make_status(StatusCode::kCorruptSerialType);
  }
  return SerialType{n};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ SerialType SerialType::for_integer(i64 value)
{
  if (value == 0) {
    return SerialType::const_int0();
  }
  if (value == 1) {
    return SerialType::const_int1();
  }
  if (value >= -(i64{1} << 7) && value < (i64{1} << 7)) {
    return SerialType::i8();
  }
  if (value >= -(i64{1} << 15) && value < (i64{1} << 15)) {
    return SerialType::i16();
  }
  if (value >= -(i64{1} << 23) && value < (i64{1} << 23)) {
    return SerialType::i24();
  }
  if (value >= -(i64{1} << 31) && value < (i64{1} << 31)) {
    return SerialType::i32();
  }
  if (value >= -(i64{1} << 47) && value < (i64{1} << 47)) {
    return SerialType::i48();
  }
  return SerialType::i64();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
SerialTypeKind SerialType::kind() const
{
  switch (this->value_) {
    case 0:
      return SerialTypeKind::kNull;
    case 1:
      return SerialTypeKind::kI8;
    case 2:
      return SerialTypeKind::kI16;
    case 3:
      return SerialTypeKind::kI24;
    case 4:
      return SerialTypeKind::kI32;
    case 5:
      return SerialTypeKind::kI48;
    case 6:
      return SerialTypeKind::kI64;
    case 7:
      return SerialTypeKind::kF64;
    case 8:
      return SerialTypeKind::kConstInt0;
    case 9:
      return SerialTypeKind::kConstInt1;
    default:
      break;
  }

  // Instances are only constructed from valid codes.
  //
  BATT_CHECK_GE(this->value_, kBlobBase);

  return (this->value_ % 2 == 0) ? SerialTypeKind::kBlob : SerialTypeKind::kText;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize SerialType::size() const
{
  switch (this->kind()) {
    case SerialTypeKind::kNull:
      return 0;
    case SerialTypeKind::kI8:
      return 1;
    case SerialTypeKind::kI16:
      return 2;
    case SerialTypeKind::kI24:
      return 3;
    case SerialTypeKind::kI32:
      return 4;
    case SerialTypeKind::kI48:
      return 6;
    case SerialTypeKind::kI64:
      return 8;
    case SerialTypeKind::kF64:
      return 8;
    case SerialTypeKind::kConstInt0:
      return 0;
    case SerialTypeKind::kConstInt1:
      return 0;
    case SerialTypeKind::kBlob:
      return (this->value_ - kBlobBase) / 2;
    case SerialTypeKind::kText:
      return (this->value_ - kTextBase) / 2;
  }
  BATT_PANIC() << "bad SerialTypeKind: " << (int)this->kind();
  BATT_UNREACHABLE();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const SerialType& t)
{
  return out << "SerialType{" << t.value() << ", " << t.kind() << "[" << t.size() << "]}";
}

}  // namespace litepage

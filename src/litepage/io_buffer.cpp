//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/io_buffer.hpp>
//

#include <batteries/assert.hpp>

#include <cstring>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ IoBuffer::Metrics& IoBuffer::metrics()
{
  static Metrics metrics_;
  return metrics_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ std::shared_ptr<IoBuffer> IoBuffer::allocate(usize size)
{
  return std::shared_ptr<IoBuffer>{new IoBuffer{size}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ std::shared_ptr<IoBuffer> IoBuffer::allocate_from(const ConstBuffer& src)
{
  std::shared_ptr<IoBuffer> buffer = IoBuffer::allocate(src.size());
  if (src.size() != 0) {
    std::memcpy(buffer->data(), src.data(), src.size());
  }
  return buffer;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ IoBuffer::IoBuffer(usize size) : size_{size}, storage_{new u8[size]()}
{
  IoBuffer::metrics().allocate_count.add(1);
  IoBuffer::metrics().allocate_bytes.add(size);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
IoBuffer::~IoBuffer() noexcept
{
  IoBuffer::metrics().deallocate_count.add(1);
  IoBuffer::metrics().deallocate_bytes.add(this->size_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
ConstBuffer IoBuffer::const_slice(usize offset, usize len) const
{
  BATT_CHECK_LE(offset, this->size_);
  BATT_CHECK_LE(len, this->size_ - offset) << BATT_INSPECT(offset);

  return ConstBuffer{this->data() + offset, len};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
MutableBuffer IoBuffer::mutable_slice(usize offset, usize len)
{
  BATT_CHECK_LE(offset, this->size_);
  BATT_CHECK_LE(len, this->size_ - offset) << BATT_INSPECT(offset);

  return MutableBuffer{this->data() + offset, len};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const IoBuffer& t)
{
  return out << "IoBuffer{.size=" << t.size() << ", .data=" << (const void*)t.data() << ",}";
}

}  // namespace litepage

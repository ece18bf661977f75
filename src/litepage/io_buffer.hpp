//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_IO_BUFFER_HPP
#define LITEPAGE_IO_BUFFER_HPP

#include <litepage/buffer.hpp>
#include <litepage/int_types.hpp>
#include <litepage/metrics.hpp>

#include <memory>
#include <ostream>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A fixed-size, heap-allocated byte region used as the source or destination of file I/O.
//
// The backing memory never moves or changes size while the IoBuffer exists, so raw views obtained
// from `const_buffer()`/`mutable_buffer()` stay valid for as long as a reference to the IoBuffer is
// held.  IoBuffer objects are always shared via `std::shared_ptr`; they can not be copied or moved.
//
// IoBuffer does not arbitrate concurrent access to its contents; callers must not mutate a buffer
// that is attached to an outstanding I/O operation.
//
class IoBuffer
{
 public:
  struct Metrics {
    CountMetric<u64> allocate_count{0};
    CountMetric<u64> allocate_bytes{0};
    CountMetric<u64> deallocate_count{0};
    CountMetric<u64> deallocate_bytes{0};
  };

  static Metrics& metrics();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  // Allocates a new zero-filled buffer of the given size.
  //
  static std::shared_ptr<IoBuffer> allocate(usize size);

  // Allocates a new buffer holding a copy of `src`.
  //
  static std::shared_ptr<IoBuffer> allocate_from(const ConstBuffer& src);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  IoBuffer(const IoBuffer&) = delete;
  IoBuffer& operator=(const IoBuffer&) = delete;

  ~IoBuffer() noexcept;

  usize size() const noexcept
  {
    return this->size_;
  }

  bool empty() const noexcept
  {
    return this->size_ == 0;
  }

  const u8* data() const noexcept
  {
    return this->storage_.get();
  }

  u8* data() noexcept
  {
    return this->storage_.get();
  }

  ConstBuffer const_buffer() const noexcept
  {
    return ConstBuffer{this->data(), this->size_};
  }

  MutableBuffer mutable_buffer() noexcept
  {
    return MutableBuffer{this->data(), this->size_};
  }

  // Returns a view of bytes [offset, offset + len); panics if the range is not inside the buffer.
  //
  ConstBuffer const_slice(usize offset, usize len) const;

  // Returns a view of bytes [offset, offset + len); panics if the range is not inside the buffer.
  //
  MutableBuffer mutable_slice(usize offset, usize len);

 private:
  explicit IoBuffer(usize size);

  const usize size_;
  const std::unique_ptr<u8[]> storage_;
};

std::ostream& operator<<(std::ostream& out, const IoBuffer& t);

}  // namespace litepage

#endif  // LITEPAGE_IO_BUFFER_HPP

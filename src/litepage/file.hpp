//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_FILE_HPP
#define LITEPAGE_FILE_HPP

#include <litepage/completion.hpp>
#include <litepage/int_types.hpp>
#include <litepage/io_buffer.hpp>
#include <litepage/status.hpp>

#include <memory>
#include <vector>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// Abstract persistent storage for a single database file.
//
// Each operation that takes a Completion returns that same Completion after arranging for it to be
// resolved exactly once, either before the call returns (synchronous backends) or later, as the
// owning IO is driven via `step()`/`drain()`/`wait_for_completion()`.  The Completion must have the
// type matching the operation; otherwise the call fails with StatusCode::kCompletionTypeMismatch and
// the Completion is left unresolved.
//
// No ordering is guaranteed between two submitted operations; callers that need ordering must wait
// for one to resolve before submitting the next.  At most one operation may be in flight on a given
// File from any one thread at a time unless the implementation documents otherwise.
//
class File
{
 public:
  File(const File&) = delete;
  File& operator=(const File&) = delete;

  virtual ~File() = default;

  // Takes an exclusive advisory lock on the file; fails with StatusCode::kFileLockConflict if it is
  // already held.
  //
  virtual Status lock_file() = 0;

  virtual Status unlock_file() = 0;

  // Returns the current logical size of the file in bytes.
  //
  virtual StatusOr<u64> size() = 0;

  // Reads up to `completion.as_read().buffer->size()` bytes starting at `pos`.  Short reads (at end
  // of file) resolve with the number of bytes actually read.
  //
  virtual StatusOr<Completion> pread(u64 pos, Completion completion) = 0;

  virtual StatusOr<Completion> pwrite(u64 pos, std::shared_ptr<const IoBuffer> buffer,
                                      Completion completion) = 0;

  // Writes `buffers` back-to-back starting at `pos`; resolves with the total byte count.
  //
  virtual StatusOr<Completion> pwritev(u64 pos, std::vector<std::shared_ptr<const IoBuffer>> buffers,
                                       Completion completion) = 0;

  virtual StatusOr<Completion> sync(Completion completion) = 0;

  virtual StatusOr<Completion> truncate(u64 len, Completion completion) = 0;

 protected:
  File() = default;
};

// Returns kCompletionTypeMismatch unless `completion.type() == expected`.
//
Status require_completion_type(const Completion& completion, CompletionType expected);

}  // namespace litepage

#endif  // LITEPAGE_FILE_HPP

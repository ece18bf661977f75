//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_MEMORY_FILE_HPP
#define LITEPAGE_MEMORY_FILE_HPP

#include <litepage/buffer.hpp>
#include <litepage/config.hpp>
#include <litepage/file.hpp>
#include <litepage/int_types.hpp>
#include <litepage/metrics.hpp>
#include <litepage/open_flags.hpp>

#include <batteries/async/mutex.hpp>

#include <array>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A File held entirely in memory, as a sparse map from page index to a fixed-size page.
//
// Every operation is performed (and its Completion resolved) before the submitting call returns.
// Ranges of the file that have never been written read back as zeros.  The page map is guarded by
// a mutex, so a MemoryFile (and all handles opened on the same MemoryIO path, which share the
// page map) may be used from multiple threads.
//
class MemoryFile : public File
{
 public:
  using Page = std::array<u8, kMemoryFilePageSize>;

  struct State {
    // Page index (file offset / kMemoryFilePageSize) to page data.
    //
    std::map<u64, std::unique_ptr<Page>> pages;

    // The logical file size in bytes.
    //
    u64 size = 0;

    // The handle currently holding the file lock, if any.
    //
    const MemoryFile* lock_owner = nullptr;
  };

  using SharedState = std::shared_ptr<batt::Mutex<State>>;

  struct Metrics {
    CountMetric<u64> read_count{0};
    CountMetric<u64> read_bytes{0};
    CountMetric<u64> write_count{0};
    CountMetric<u64> write_bytes{0};
    CountMetric<u64> sync_count{0};
    CountMetric<u64> truncate_count{0};
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  static SharedState new_state();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  // Creates a new, empty, writable file.
  //
  explicit MemoryFile(std::string_view path);

  // Creates a handle on existing file contents.
  //
  explicit MemoryFile(std::string_view path, SharedState state, OpenFlags flags);

  ~MemoryFile() noexcept;

  const std::string& path() const
  {
    return this->path_;
  }

  OpenFlags flags() const
  {
    return this->flags_;
  }

  const Metrics& metrics() const
  {
    return this->metrics_;
  }

  // Returns the number of pages currently allocated in the page map.
  //
  usize resident_page_count() const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // File interface

  Status lock_file() override;

  Status unlock_file() override;

  StatusOr<u64> size() override;

  StatusOr<Completion> pread(u64 pos, Completion completion) override;

  StatusOr<Completion> pwrite(u64 pos, std::shared_ptr<const IoBuffer> buffer,
                              Completion completion) override;

  StatusOr<Completion> pwritev(u64 pos, std::vector<std::shared_ptr<const IoBuffer>> buffers,
                               Completion completion) override;

  StatusOr<Completion> sync(Completion completion) override;

  StatusOr<Completion> truncate(u64 len, Completion completion) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
 private:
  // Copies up to `dst.size()` bytes starting at `pos` into `dst`; returns the number copied.
  //
  static usize read_locked(const State& state, u64 pos, const MutableBuffer& dst);

  static void write_locked(State& state, u64 pos, const ConstBuffer& src);

  static void truncate_locked(State& state, u64 len);

  bool is_read_only() const
  {
    return this->flags_.contains(OpenFlags::kReadOnly);
  }

  const std::string path_;

  const OpenFlags flags_;

  const SharedState state_;

  Metrics metrics_;
};

}  // namespace litepage

#endif  // LITEPAGE_MEMORY_FILE_HPP

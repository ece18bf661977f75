//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_POSIX_FILE_HPP
#define LITEPAGE_POSIX_FILE_HPP

#include <litepage/file.hpp>
#include <litepage/metrics.hpp>
#include <litepage/open_flags.hpp>

#include <string>
#include <string_view>

namespace litepage {

struct PosixIoOptions {
  // Use fdatasync instead of fsync to implement `File::sync`.
  //
  bool sync_data_only = false;

  // Take the advisory file lock as part of `IO::open_file`.
  //
  bool lock_on_open = false;
};

std::ostream& operator<<(std::ostream& out, const PosixIoOptions& t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A File backed by a POSIX file descriptor.  Operations are performed with blocking system calls,
// and each Completion is resolved before the submitting call returns.
//
class PosixFile : public File
{
 public:
  struct Metrics {
    CountMetric<u64> read_count{0};
    CountMetric<u64> read_bytes{0};
    CountMetric<u64> write_count{0};
    CountMetric<u64> write_bytes{0};
    CountMetric<u64> sync_count{0};
    CountMetric<u64> truncate_count{0};
    CountMetric<u64> error_count{0};
  };

  // Takes ownership of `fd`; it is closed when the PosixFile is destroyed.
  //
  explicit PosixFile(std::string_view path, int fd, OpenFlags flags,
                     const PosixIoOptions& options) noexcept;

  ~PosixFile() noexcept;

  const std::string& path() const
  {
    return this->path_;
  }

  OpenFlags flags() const
  {
    return this->flags_;
  }

  int file_descriptor() const
  {
    return this->fd_;
  }

  const Metrics& metrics() const
  {
    return this->metrics_;
  }

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

 private:
  // Resolves `completion` with `result` and updates the error count.
  //
  void finish(Completion& completion, const StatusOr<i32>& result);

  const std::string path_;
  const int fd_;
  const OpenFlags flags_;
  const PosixIoOptions options_;
  Metrics metrics_;
};

}  // namespace litepage

#endif  // LITEPAGE_POSIX_FILE_HPP

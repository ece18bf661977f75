//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_POSIX_IO_HPP
#define LITEPAGE_POSIX_IO_HPP

#include <litepage/clock.hpp>
#include <litepage/io.hpp>
#include <litepage/posix_file.hpp>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// An IO that opens files in the host filesystem.  All operations are blocking, so every Completion is
// resolved by the time the File call that submitted it returns.
//
class PosixIO : public IO
{
 public:
  explicit PosixIO(const PosixIoOptions& options = PosixIoOptions{}) noexcept;

  const PosixIoOptions& options() const
  {
    return this->options_;
  }

  Instant now() const override;

  StatusOr<std::shared_ptr<File>> open_file(std::string_view path,
                                            OpenFlags flags = OpenFlags{}) override;

  Status remove_file(std::string_view path) override;

  Status step() override;

  Status cancel(const std::vector<Completion>& completions) override;

  Status drain() override;

  Status wait_for_completion(const Completion& completion) override;

 private:
  const PosixIoOptions options_;
  SystemClock clock_;
};

}  // namespace litepage

#endif  // LITEPAGE_POSIX_IO_HPP

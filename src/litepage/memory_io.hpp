//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_MEMORY_IO_HPP
#define LITEPAGE_MEMORY_IO_HPP

#include <litepage/clock.hpp>
#include <litepage/io.hpp>
#include <litepage/memory_file.hpp>

#include <batteries/async/mutex.hpp>

#include <map>
#include <string>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// An IO whose files live in memory, keyed by path.
//
// Opening the same path twice yields two MemoryFile handles over the same contents.  Removing a
// path detaches it from the registry; handles that are already open keep the old contents.  All
// operations complete synchronously, so `step`, `cancel`, and `drain` have nothing to do.
//
class MemoryIO : public IO
{
 public:
  MemoryIO() = default;

  Instant now() const override;

  StatusOr<std::shared_ptr<File>> open_file(std::string_view path,
                                            OpenFlags flags = OpenFlags{}) override;

  Status remove_file(std::string_view path) override;

  Status step() override;

  Status cancel(const std::vector<Completion>& completions) override;

  Status drain() override;

  Status wait_for_completion(const Completion& completion) override;

  // Returns true iff a file with the given path is currently registered.
  //
  bool file_exists(std::string_view path);

 private:
  SystemClock clock_;

  batt::Mutex<std::map<std::string, MemoryFile::SharedState, std::less<>>> files_;
};

}  // namespace litepage

#endif  // LITEPAGE_MEMORY_IO_HPP

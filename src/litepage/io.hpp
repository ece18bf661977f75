//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_IO_HPP
#define LITEPAGE_IO_HPP

#include <litepage/clock.hpp>
#include <litepage/completion.hpp>
#include <litepage/file.hpp>
#include <litepage/open_flags.hpp>
#include <litepage/status.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace litepage {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// The reactor surface that opens Files and drives their outstanding operations.
//
// Callers that only use the File/Completion contract are portable across backends: a synchronous
// backend resolves every Completion inside the submitting call, an asynchronous one resolves them as
// `step()`, `drain()`, or `wait_for_completion()` are called.
//
class IO : public Clock
{
 public:
  IO(const IO&) = delete;
  IO& operator=(const IO&) = delete;

  virtual ~IO() = default;

  virtual StatusOr<std::shared_ptr<File>> open_file(std::string_view path,
                                                    OpenFlags flags = OpenFlags{}) = 0;

  virtual Status remove_file(std::string_view path) = 0;

  // Advances pending asynchronous work by one increment.
  //
  virtual Status step() = 0;

  // Best-effort cancellation; completions that are cancelled resolve with
  // batt::StatusCode::kCancelled.
  //
  virtual Status cancel(const std::vector<Completion>& completions) = 0;

  // Blocks until all outstanding work has finished.
  //
  virtual Status drain() = 0;

  virtual Status wait_for_completion(const Completion& completion) = 0;

 protected:
  IO() = default;
};

}  // namespace litepage

#endif  // LITEPAGE_IO_HPP

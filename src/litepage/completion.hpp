//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_COMPLETION_HPP
#define LITEPAGE_COMPLETION_HPP

#include <litepage/int_types.hpp>
#include <litepage/io_buffer.hpp>
#include <litepage/optional.hpp>
#include <litepage/status.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <ostream>
#include <variant>

namespace litepage {

enum struct CompletionType {
  kRead,
  kWrite,
  kSync,
  kTruncate,
};

std::ostream& operator<<(std::ostream& out, CompletionType t);

// The value passed to the handler of a successful Read completion.
//
struct ReadResult {
  std::shared_ptr<IoBuffer> buffer;
  i32 bytes_read;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// A one-shot carrier for the outcome of a single I/O operation.
//
// A Completion is created describing the operation (Read, Write, Sync, or Truncate) and the handler
// to invoke, then handed to a File.  The File resolves it exactly once, either by calling
// `complete(n)` with a non-negative byte count or `error(status)`.  The handler runs synchronously
// on the thread that resolves the completion.  Resolving a Completion twice is a fatal error.
//
// Completion is a cheap, copyable handle; all copies refer to the same operation.
//
class Completion
{
 public:
  using ReadHandler = std::function<void(const StatusOr<ReadResult>& result)>;
  using ResultHandler = std::function<void(const StatusOr<i32>& result)>;

  struct Read {
    std::shared_ptr<IoBuffer> buffer;
    ReadHandler handler;
  };

  struct Write {
    ResultHandler handler;
  };

  struct Sync {
    ResultHandler handler;
  };

  struct Truncate {
    ResultHandler handler;
  };

  using Operation = std::variant<Read, Write, Sync, Truncate>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  static Completion new_read(std::shared_ptr<IoBuffer> buffer, ReadHandler&& handler);

  static Completion new_write(ResultHandler&& handler);

  static Completion new_sync(ResultHandler&& handler);

  static Completion new_truncate(ResultHandler&& handler);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  CompletionType type() const;

  // Returns true iff this completion has been resolved and its result is visible.
  //
  bool is_resolved() const;

  // Returns the result of the operation, or None if it is still pending.
  //
  Optional<StatusOr<i32>> result() const;

  // Panics if this is not a Read completion.
  //
  const Read& as_read() const;

  // Resolves the operation successfully with the given byte count.
  //
  void complete(i32 n);

  // Resolves the operation with an error; `status` must not be ok.
  //
  void error(const Status& status);

  // Returns true iff `other` is a handle to the same operation as this.
  //
  bool is_same_as(const Completion& other) const
  {
    return this->state_ == other.state_;
  }

 private:
  struct State {
    explicit State(Operation&& op) noexcept : op{std::move(op)}
    {
    }

    Operation op;

    // Set by the first (and only) caller to resolve the completion.
    //
    std::atomic<bool> claimed{false};

    // Set after `result` has been written.
    //
    std::atomic<bool> ready{false};

    Optional<StatusOr<i32>> result;
  };

  explicit Completion(Operation&& op);

  void resolve(const StatusOr<i32>& result);

  std::shared_ptr<State> state_;
};

std::ostream& operator<<(std::ostream& out, const Completion& t);

}  // namespace litepage

#endif  // LITEPAGE_COMPLETION_HPP

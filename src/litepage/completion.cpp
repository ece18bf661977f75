//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/completion.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/case_of.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, CompletionType t)
{
  switch (t) {
    case CompletionType::kRead:
      return out << "Read";
    case CompletionType::kWrite:
      return out << "Write";
    case CompletionType::kSync:
      return out << "Sync";
    case CompletionType::kTruncate:
      return out << "Truncate";
  }
  return out << "(bad value:" << (int)t << ")";
}

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
// class Completion
//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Completion Completion::new_read(std::shared_ptr<IoBuffer> buffer,
                                           ReadHandler&& handler)
{
  BATT_CHECK_NOT_NULLPTR(buffer);

  return Completion{Read{std::move(buffer), std::move(handler)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Completion Completion::new_write(ResultHandler&& handler)
{
  return Completion{Write{std::move(handler)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Completion Completion::new_sync(ResultHandler&& handler)
{
  return Completion{Sync{std::move(handler)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Completion Completion::new_truncate(ResultHandler&& handler)
{
  return Completion{Truncate{std::move(handler)}};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ Completion::Completion(Operation&& op)
    : state_{std::make_shared<State>(std::move(op))}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
CompletionType Completion::type() const
{
  return batt::case_of(
      this->state_->op,
      [](const Read&) {
        return CompletionType::kRead;
      },
      [](const Write&) {
        return CompletionType::kWrite;
      },
      [](const Sync&) {
        return CompletionType::kSync;
      },
      [](const Truncate&) {
        return CompletionType::kTruncate;
      });
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool Completion::is_resolved() const
{
  return this->state_->ready.load(std::memory_order_acquire);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Optional<StatusOr<i32>> Completion::result() const
{
  if (!this->is_resolved()) {
    return None;
  }
  return this->state_->result;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
auto Completion::as_read() const -> const Read&
{
  const Read* read = std::get_if<Read>(&this->state_->op);
  BATT_CHECK_NOT_NULLPTR(read) << "Completion is not a Read; " << BATT_INSPECT(this->type());

  return *read;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Completion::complete(i32 n)
{
  BATT_CHECK_GE(n, 0);

  this->resolve(StatusOr<i32>{n});
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Completion::error(const Status& status)
{
  BATT_CHECK(!status.ok()) << "Completion::error must be passed a non-ok status";

  this->resolve(StatusOr<i32>{status});
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void Completion::resolve(const StatusOr<i32>& result)
{
  const bool already_claimed = this->state_->claimed.exchange(true);
  BATT_CHECK(!already_claimed) << "Completion resolved twice! " << BATT_INSPECT(this->type())
                               << BATT_INSPECT(result);

  this->state_->result.emplace(result);
  this->state_->ready.store(true, std::memory_order_release);

  LITEPAGE_VLOG(2) << "Completion::resolve" << BATT_INSPECT(this->type()) << BATT_INSPECT(result);

  batt::case_of(
      this->state_->op,
      [&result](const Read& read) {
        if (!read.handler) {
          return;
        }
        if (!result.ok()) {
          read.handler(StatusOr<ReadResult>{result.status()});
        } else {
          read.handler(StatusOr<ReadResult>{ReadResult{read.buffer, *result}});
        }
      },
      [&result](const Write& write) {
        if (write.handler) {
          write.handler(result);
        }
      },
      [&result](const Sync& sync) {
        if (sync.handler) {
          sync.handler(result);
        }
      },
      [&result](const Truncate& truncate) {
        if (truncate.handler) {
          truncate.handler(result);
        }
      });
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Completion& t)
{
  out << "Completion{.type=" << t.type() << ", .result=";
  Optional<StatusOr<i32>> result = t.result();
  if (result) {
    out << *result;
  } else {
    out << "(pending)";
  }
  return out << ",}";
}

}  // namespace litepage

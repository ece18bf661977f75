//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/posix_file.hpp>
//

#include <litepage/filesystem.hpp>
#include <litepage/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/checked_cast.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const PosixIoOptions& t)
{
  return out << "PosixIoOptions{.sync_data_only=" << t.sync_data_only
             << ", .lock_on_open=" << t.lock_on_open << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ PosixFile::PosixFile(std::string_view path, int fd, OpenFlags flags,
                                  const PosixIoOptions& options) noexcept
    : path_{path}
    , fd_{fd}
    , flags_{flags}
    , options_{options}
{
  BATT_CHECK_GE(this->fd_, 0);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
PosixFile::~PosixFile() noexcept
{
  LITEPAGE_WARN_IF_NOT_OK(close_fd(this->fd_)) << BATT_INSPECT(this->path_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixFile::lock_file()
{
  Status status = lock_fd(this->fd_);
  if (status == make_status(StatusCode::kFileLockConflict)) {
    LITEPAGE_LOG_WARNING() << "lock conflict on PosixFile;" << BATT_INSPECT(this->path_);
  }
  return status;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixFile::unlock_file()
{
  return unlock_fd(this->fd_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<u64> PosixFile::size()
{
  return sizeof_fd(this->fd_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> PosixFile::pread(u64 pos, Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kRead));

  const std::shared_ptr<IoBuffer>& buffer = completion.as_read().buffer;

  LITEPAGE_VLOG(1) << "PosixFile::pread" << BATT_INSPECT(this->path_) << BATT_INSPECT(pos)
                   << BATT_INSPECT(buffer->size());

  StatusOr<ConstBuffer> data = read_fd(this->fd_, buffer->mutable_buffer(), pos);
  if (data.ok()) {
    this->metrics_.read_count.add(1);
    this->metrics_.read_bytes.add(data->size());
    this->finish(completion, StatusOr<i32>{batt::checked_cast<i32>(data->size())});
  } else {
    this->finish(completion, data.status());
  }

  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> PosixFile::pwrite(u64 pos, std::shared_ptr<const IoBuffer> buffer,
                                       Completion completion)
{
  BATT_CHECK_NOT_NULLPTR(buffer);

  std::vector<std::shared_ptr<const IoBuffer>> buffers;
  buffers.emplace_back(std::move(buffer));

  return this->pwritev(pos, std::move(buffers), std::move(completion));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> PosixFile::pwritev(u64 pos,
                                        std::vector<std::shared_ptr<const IoBuffer>> buffers,
                                        Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kWrite));

  const StatusOr<i32> result = [&]() -> StatusOr<i32> {
    usize n_written = 0;
    for (const std::shared_ptr<const IoBuffer>& buffer : buffers) {
      BATT_CHECK_NOT_NULLPTR(buffer);

      BATT_REQUIRE_OK(write_fd(this->fd_, buffer->const_buffer(), pos + n_written));
      n_written += buffer->size();
    }
    return batt::checked_cast<i32>(n_written);
  }();

  LITEPAGE_VLOG(1) << "PosixFile::pwritev" << BATT_INSPECT(this->path_) << BATT_INSPECT(pos)
                   << BATT_INSPECT(buffers.size()) << BATT_INSPECT(result);

  if (result.ok()) {
    this->metrics_.write_count.add(1);
    this->metrics_.write_bytes.add(*result);
  }
  this->finish(completion, result);

  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> PosixFile::sync(Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kSync));

  Status status = sync_fd(this->fd_, SyncDataOnly{this->options_.sync_data_only});
  if (status.ok()) {
    this->metrics_.sync_count.add(1);
    this->finish(completion, StatusOr<i32>{0});
  } else {
    this->finish(completion, status);
  }

  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> PosixFile::truncate(u64 len, Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kTruncate));

  LITEPAGE_VLOG(1) << "PosixFile::truncate" << BATT_INSPECT(this->path_) << BATT_INSPECT(len);

  Status status = truncate_fd(this->fd_, len);
  if (status.ok()) {
    this->metrics_.truncate_count.add(1);
    this->finish(completion, StatusOr<i32>{0});
  } else {
    this->finish(completion, status);
  }

  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void PosixFile::finish(Completion& completion, const StatusOr<i32>& result)
{
  if (result.ok()) {
    completion.complete(*result);
  } else {
    this->metrics_.error_count.add(1);
    completion.error(result.status());
  }
}

}  // namespace litepage

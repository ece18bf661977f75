//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/posix_io.hpp>
//

#include <litepage/filesystem.hpp>
#include <litepage/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/finally.hpp>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ PosixIO::PosixIO(const PosixIoOptions& options) noexcept : options_{options}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Instant PosixIO::now() const
{
  return this->clock_.now();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<File>> PosixIO::open_file(std::string_view path, OpenFlags flags)
{
  StatusOr<int> fd = open_fd(path, flags);
  if (!fd.ok()) {
    LITEPAGE_LOG_WARNING() << "PosixIO::open_file failed;" << BATT_INSPECT(path)
                           << BATT_INSPECT(flags) << BATT_INSPECT(fd.status());
    return fd.status();
  }

  auto close_on_error = batt::finally([&] {
    if (*fd >= 0) {
      LITEPAGE_WARN_IF_NOT_OK(close_fd(*fd));
    }
  });

  if (this->options_.lock_on_open) {
    Status locked = lock_fd(*fd);
    if (!locked.ok()) {
      LITEPAGE_LOG_WARNING() << "PosixIO::open_file could not lock;" << BATT_INSPECT(path)
                             << BATT_INSPECT(locked);
      return locked;
    }
  }

  LITEPAGE_VLOG(1) << "PosixIO::open_file" << BATT_INSPECT(path) << BATT_INSPECT(flags)
                   << BATT_INSPECT(*fd);

  std::shared_ptr<File> file = std::make_shared<PosixFile>(path, *fd, flags, this->options_);
  *fd = -1;

  return file;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixIO::remove_file(std::string_view path)
{
  LITEPAGE_VLOG(1) << "PosixIO::remove_file" << BATT_INSPECT(path);

  return delete_file(path);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixIO::step()
{
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixIO::cancel(const std::vector<Completion>& completions)
{
  LITEPAGE_VLOG(1) << "PosixIO::cancel (no-op)" << BATT_INSPECT(completions.size());

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixIO::drain()
{
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status PosixIO::wait_for_completion(const Completion& completion)
{
  if (!completion.is_resolved()) {
    return make_status(StatusCode::kCompletionPending);
  }
  return OkStatus();
}

}  // namespace litepage

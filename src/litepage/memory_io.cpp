//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/memory_io.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/assert.hpp>

#include <cerrno>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Instant MemoryIO::now() const
{
  return this->clock_.now();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<std::shared_ptr<File>> MemoryIO::open_file(std::string_view path, OpenFlags flags)
{
  MemoryFile::SharedState state;
  {
    auto locked = this->files_.lock();

    auto iter = locked->find(path);
    if (iter != locked->end()) {
      state = iter->second;
    } else {
      if (!flags.contains(OpenFlags::kCreate)) {
        LITEPAGE_LOG_WARNING() << "MemoryIO::open_file failed; no such file and kCreate not set;"
                               << BATT_INSPECT(path) << BATT_INSPECT(flags);
        return status_from_errno(ENOENT);
      }
      state = MemoryFile::new_state();
      locked->emplace(std::string{path}, state);
    }
  }

  LITEPAGE_VLOG(1) << "MemoryIO::open_file" << BATT_INSPECT(path) << BATT_INSPECT(flags);

  std::shared_ptr<File> file = std::make_shared<MemoryFile>(path, std::move(state), flags);
  return file;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryIO::remove_file(std::string_view path)
{
  auto locked = this->files_.lock();

  auto iter = locked->find(path);
  if (iter == locked->end()) {
    return status_from_errno(ENOENT);
  }
  locked->erase(iter);

  LITEPAGE_VLOG(1) << "MemoryIO::remove_file" << BATT_INSPECT(path);

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool MemoryIO::file_exists(std::string_view path)
{
  auto locked = this->files_.lock();
  return locked->find(path) != locked->end();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryIO::step()
{
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryIO::cancel(const std::vector<Completion>& completions)
{
  LITEPAGE_VLOG(1) << "MemoryIO::cancel (no-op)" << BATT_INSPECT(completions.size());

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryIO::drain()
{
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryIO::wait_for_completion(const Completion& completion)
{
  // Every MemoryFile operation resolves its completion before returning, so an unresolved one was
  // never submitted here.
  //
  if (!completion.is_resolved()) {
    return make_status(StatusCode::kCompletionPending);
  }
  return OkStatus();
}

}  // namespace litepage

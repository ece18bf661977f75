//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/memory_file.hpp>
//

#include <litepage/logging.hpp>

#include <batteries/assert.hpp>
#include <batteries/checked_cast.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ MemoryFile::SharedState MemoryFile::new_state()
{
  return std::make_shared<batt::Mutex<State>>();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MemoryFile::MemoryFile(std::string_view path)
    : MemoryFile{path, MemoryFile::new_state(), OpenFlags::kCreate}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*explicit*/ MemoryFile::MemoryFile(std::string_view path, SharedState state, OpenFlags flags)
    : path_{path}
    , flags_{flags}
    , state_{std::move(state)}
{
  BATT_CHECK_NOT_NULLPTR(this->state_);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
MemoryFile::~MemoryFile() noexcept
{
  auto locked = this->state_->lock();
  if (locked->lock_owner == this) {
    locked->lock_owner = nullptr;
  }
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize MemoryFile::resident_page_count() const
{
  return this->state_->lock()->pages.size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryFile::lock_file()
{
  auto locked = this->state_->lock();
  if (locked->lock_owner != nullptr) {
    LITEPAGE_LOG_WARNING() << "lock conflict on MemoryFile;" << BATT_INSPECT(this->path_)
                           << BATT_INSPECT(locked->lock_owner == this);
    return make_status(StatusCode::kFileLockConflict);
  }
  locked->lock_owner = this;
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status MemoryFile::unlock_file()
{
  auto locked = this->state_->lock();
  if (locked->lock_owner == this) {
    locked->lock_owner = nullptr;
  }
  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<u64> MemoryFile::size()
{
  return this->state_->lock()->size;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> MemoryFile::pread(u64 pos, Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kRead));

  const std::shared_ptr<IoBuffer>& buffer = completion.as_read().buffer;

  const usize n_read = [&] {
    auto locked = this->state_->lock();
    return MemoryFile::read_locked(*locked, pos, buffer->mutable_buffer());
  }();

  LITEPAGE_VLOG(1) << "MemoryFile::pread" << BATT_INSPECT(this->path_) << BATT_INSPECT(pos)
                   << BATT_INSPECT(buffer->size()) << BATT_INSPECT(n_read);

  this->metrics_.read_count.add(1);
  this->metrics_.read_bytes.add(n_read);

  completion.complete(batt::checked_cast<i32>(n_read));
  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> MemoryFile::pwrite(u64 pos, std::shared_ptr<const IoBuffer> buffer,
                                        Completion completion)
{
  BATT_CHECK_NOT_NULLPTR(buffer);

  std::vector<std::shared_ptr<const IoBuffer>> buffers;
  buffers.emplace_back(std::move(buffer));

  return this->pwritev(pos, std::move(buffers), std::move(completion));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> MemoryFile::pwritev(u64 pos,
                                         std::vector<std::shared_ptr<const IoBuffer>> buffers,
                                         Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kWrite));

  if (this->is_read_only()) {
    completion.error(status_from_errno(EBADF));
    return completion;
  }

  usize n_written = 0;
  {
    auto locked = this->state_->lock();
    for (const std::shared_ptr<const IoBuffer>& buffer : buffers) {
      BATT_CHECK_NOT_NULLPTR(buffer);

      MemoryFile::write_locked(*locked, pos + n_written, buffer->const_buffer());
      n_written += buffer->size();
    }
  }

  LITEPAGE_VLOG(1) << "MemoryFile::pwritev" << BATT_INSPECT(this->path_) << BATT_INSPECT(pos)
                   << BATT_INSPECT(buffers.size()) << BATT_INSPECT(n_written);

  this->metrics_.write_count.add(1);
  this->metrics_.write_bytes.add(n_written);

  completion.complete(batt::checked_cast<i32>(n_written));
  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> MemoryFile::sync(Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kSync));

  this->metrics_.sync_count.add(1);

  completion.complete(0);
  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<Completion> MemoryFile::truncate(u64 len, Completion completion)
{
  BATT_REQUIRE_OK(require_completion_type(completion, CompletionType::kTruncate));

  if (this->is_read_only()) {
    completion.error(status_from_errno(EBADF));
    return completion;
  }

  {
    auto locked = this->state_->lock();

    LITEPAGE_VLOG(1) << "MemoryFile::truncate" << BATT_INSPECT(this->path_) << BATT_INSPECT(len)
                     << " (was " << locked->size << ")";

    MemoryFile::truncate_locked(*locked, len);
  }

  this->metrics_.truncate_count.add(1);

  completion.complete(0);
  return completion;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ usize MemoryFile::read_locked(const State& state, u64 pos, const MutableBuffer& dst)
{
  if (pos >= state.size || dst.size() == 0) {
    return 0;
  }

  const usize n_to_read = std::min<u64>(dst.size(), state.size - pos);
  u8* const out = static_cast<u8*>(dst.data());

  usize n_read = 0;
  while (n_read < n_to_read) {
    const u64 offset = pos + n_read;
    const u64 page_index = offset / kMemoryFilePageSize;
    const usize page_offset = offset % kMemoryFilePageSize;
    const usize n_chunk = std::min<usize>(n_to_read - n_read, kMemoryFilePageSize - page_offset);

    auto iter = state.pages.find(page_index);
    if (iter == state.pages.end()) {
      std::memset(out + n_read, 0, n_chunk);
    } else {
      std::memcpy(out + n_read, iter->second->data() + page_offset, n_chunk);
    }
    n_read += n_chunk;
  }

  return n_read;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ void MemoryFile::write_locked(State& state, u64 pos, const ConstBuffer& src)
{
  const u8* const in = static_cast<const u8*>(src.data());

  usize n_written = 0;
  while (n_written < src.size()) {
    const u64 offset = pos + n_written;
    const u64 page_index = offset / kMemoryFilePageSize;
    const usize page_offset = offset % kMemoryFilePageSize;
    const usize n_chunk = std::min<usize>(src.size() - n_written, kMemoryFilePageSize - page_offset);

    std::unique_ptr<Page>& page = state.pages[page_index];
    if (!page) {
      page = std::make_unique<Page>();
      page->fill(0);
    }
    std::memcpy(page->data() + page_offset, in + n_written, n_chunk);
    n_written += n_chunk;
  }

  state.size = std::max<u64>(state.size, pos + n_written);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ void MemoryFile::truncate_locked(State& state, u64 len)
{
  // Drop every page that starts at or past the new end of file.
  //
  const u64 first_dropped_page = (len + kMemoryFilePageSize - 1) / kMemoryFilePageSize;
  state.pages.erase(state.pages.lower_bound(first_dropped_page), state.pages.end());

  // The last retained page may extend past `len`; clear its tail so that a later extension of the
  // file reads zeros there.
  //
  const usize tail_offset = len % kMemoryFilePageSize;
  if (tail_offset != 0) {
    auto iter = state.pages.find(len / kMemoryFilePageSize);
    if (iter != state.pages.end()) {
      std::fill(iter->second->begin() + tail_offset, iter->second->end(), 0);
    }
  }

  state.size = len;
}

}  // namespace litepage

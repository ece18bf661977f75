//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/filesystem.hpp>
//

#include <batteries/syscall_retry.hpp>

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace litepage {

using ::batt::syscall_retry;

namespace {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
int build_open_flags(OpenFlags flags)
{
  int os_flags = O_CLOEXEC;

  if (flags.contains(OpenFlags::kReadOnly)) {
    os_flags |= O_RDONLY;
  } else {
    os_flags |= O_RDWR;
  }

  if (flags.contains(OpenFlags::kCreate)) {
    os_flags |= O_CREAT;
  }

  return os_flags;
}

}  //namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<int> open_fd(std::string_view file_name, OpenFlags flags)
{
  const int os_flags = build_open_flags(flags);

  const int fd = syscall_retry([&] {
    return ::open(std::string(file_name).c_str(), os_flags, /*mode=*/0644);
  });
  BATT_REQUIRE_OK(status_from_retval(fd));

  return fd;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status close_fd(int fd)
{
  return status_from_retval(::close(fd));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<ConstBuffer> read_fd(int fd, MutableBuffer buffer, u64 offset)
{
  ConstBuffer contents{buffer.data(), /*size=*/0};
  while (buffer.size() > 0) {
    const auto bytes_read = syscall_retry([&] {
      return ::pread(fd, buffer.data(), buffer.size(), offset + contents.size());
    });
    BATT_REQUIRE_OK(status_from_retval(bytes_read));

    if (bytes_read == 0) {
      break;
    }

    contents = ConstBuffer{contents.data(), contents.size() + bytes_read};
    buffer += bytes_read;
  }

  return contents;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status write_fd(int fd, ConstBuffer buffer, u64 offset)
{
  while (buffer.size() > 0) {
    const auto bytes_written = syscall_retry([&] {
      return ::pwrite(fd, buffer.data(), buffer.size(), offset);
    });
    BATT_REQUIRE_OK(status_from_retval(bytes_written));

    // pwrite never legitimately makes zero progress on a non-empty regular-file write.
    //
    if (bytes_written == 0) {
      return status_from_errno(EIO);
    }

    buffer += bytes_written;
    offset += bytes_written;
  }

  return OkStatus();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status truncate_fd(int fd, u64 size)
{
  const int retval = syscall_retry([&] {
    return ::ftruncate(fd, size);
  });
  return status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status sync_fd(int fd, SyncDataOnly data_only)
{
  const int retval = syscall_retry([&] {
    if (data_only) {
      return ::fdatasync(fd);
    }
    return ::fsync(fd);
  });
  return status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<u64> sizeof_fd(int fd)
{
  struct stat st;
  const int retval = syscall_retry([&] {
    return ::fstat(fd, &st);
  });
  BATT_REQUIRE_OK(status_from_retval(retval));

  return static_cast<u64>(st.st_size);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status lock_fd(int fd)
{
  const int retval = syscall_retry([&] {
    return ::flock(fd, LOCK_EX | LOCK_NB);
  });
  if (retval != 0 && errno == EWOULDBLOCK) {
    return make_status(StatusCode::kFileLockConflict);
  }
  return status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status unlock_fd(int fd)
{
  const int retval = syscall_retry([&] {
    return ::flock(fd, LOCK_UN);
  });
  return status_from_retval(retval);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Status delete_file(std::string_view file_name)
{
  return status_from_retval(syscall_retry([&] {
    return ::unlink(std::string(file_name).c_str());
  }));
}

}  // namespace litepage

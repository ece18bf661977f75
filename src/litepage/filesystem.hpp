//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

// Thin wrappers around the POSIX file descriptor API, reporting errors as Status.
//
#pragma once
#ifndef LITEPAGE_FILESYSTEM_HPP
#define LITEPAGE_FILESYSTEM_HPP

#include <litepage/buffer.hpp>
#include <litepage/int_types.hpp>
#include <litepage/open_flags.hpp>
#include <litepage/status.hpp>

#include <batteries/strong_typedef.hpp>

#include <string_view>

namespace litepage {

BATT_STRONG_TYPEDEF(bool, SyncDataOnly);

// Opens `file_name` read-write, or read-only if `flags` contains kReadOnly; creates the file (mode
// 0644) if `flags` contains kCreate.
//
StatusOr<int> open_fd(std::string_view file_name, OpenFlags flags);

Status close_fd(int fd);

// Reads into `buffer` starting at `offset` until the buffer is full or end-of-file is reached.
// Returns the prefix of `buffer` that was filled.
//
StatusOr<ConstBuffer> read_fd(int fd, MutableBuffer buffer, u64 offset);

Status write_fd(int fd, ConstBuffer buffer, u64 offset);

Status truncate_fd(int fd, u64 size);

Status sync_fd(int fd, SyncDataOnly data_only);

StatusOr<u64> sizeof_fd(int fd);

// Takes a non-blocking exclusive advisory lock on the file; returns StatusCode::kFileLockConflict if
// some other open file description holds it.
//
Status lock_fd(int fd);

Status unlock_fd(int fd);

Status delete_file(std::string_view file_name);

}  // namespace litepage

#endif  // LITEPAGE_FILESYSTEM_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/posix_io.hpp>
//
#include <litepage/posix_io.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <litepage/filesystem.hpp>
#include <litepage/status_code.hpp>

#include <batteries/status.hpp>

#include <cerrno>
#include <filesystem>
#include <string>

namespace {

using namespace litepage::int_types;

using litepage::Completion;
using litepage::File;
using litepage::IoBuffer;
using litepage::OpenFlags;
using litepage::PosixFile;
using litepage::PosixIO;
using litepage::PosixIoOptions;
using litepage::StatusOr;

class PosixIOTest : public ::testing::Test
{
 public:
  void SetUp() override
  {
    std::filesystem::remove(this->file_name);
  }

  void TearDown() override
  {
    std::filesystem::remove(this->file_name);
  }

  std::shared_ptr<File> open(PosixIO& io, OpenFlags flags = OpenFlags{})
  {
    StatusOr<std::shared_ptr<File>> file = io.open_file(this->file_name, flags);
    BATT_CHECK_OK(file);
    return *file;
  }

  StatusOr<i32> write_string(File& file, u64 pos, const std::string& s)
  {
    BATT_ASSIGN_OK_RESULT(
        Completion c,
        file.pwrite(pos, IoBuffer::allocate_from(litepage::ConstBuffer{s.data(), s.size()}),
                    Completion::new_write(nullptr)));
    return *c.result();
  }

  StatusOr<std::string> read_string(File& file, u64 pos, usize len)
  {
    std::shared_ptr<IoBuffer> buffer = IoBuffer::allocate(len);
    BATT_ASSIGN_OK_RESULT(Completion c, file.pread(pos, Completion::new_read(buffer, nullptr)));
    BATT_ASSIGN_OK_RESULT(i32 n_read, *c.result());
    return std::string((const char*)buffer->data(), n_read);
  }

  const std::string file_name = "/tmp/litepage_PosixIOTest_file.db";
};

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, OpenMissingWithoutCreate)
{
  PosixIO io;

  StatusOr<std::shared_ptr<File>> file = io.open_file(this->file_name, OpenFlags::kNone);
  EXPECT_EQ(file.status(), batt::status_from_errno(ENOENT));

  EXPECT_EQ(io.remove_file(this->file_name), batt::status_from_errno(ENOENT));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, WriteReadRoundTrip)
{
  PosixIO io;
  std::shared_ptr<File> file = this->open(io);

  EXPECT_EQ(*file->size(), 0u);

  StatusOr<i32> n_written = this->write_string(*file, 10, "page bytes");
  ASSERT_TRUE(n_written.ok()) << n_written.status();
  EXPECT_EQ(*n_written, 10);
  EXPECT_EQ(*file->size(), 20u);

  StatusOr<std::string> data = this->read_string(*file, 10, 10);
  ASSERT_TRUE(data.ok()) << data.status();
  EXPECT_THAT(*data, ::testing::StrEq("page bytes"));

  // The hole before the write reads as zeros; reads past the end are short.
  //
  StatusOr<std::string> hole = this->read_string(*file, 0, 10);
  ASSERT_TRUE(hole.ok()) << hole.status();
  EXPECT_EQ(*hole, std::string(10, '\0'));

  StatusOr<std::string> tail = this->read_string(*file, 15, 100);
  ASSERT_TRUE(tail.ok()) << tail.status();
  EXPECT_THAT(*tail, ::testing::StrEq("bytes"));

  StatusOr<std::string> past_end = this->read_string(*file, 1000, 100);
  ASSERT_TRUE(past_end.ok()) << past_end.status();
  EXPECT_TRUE(past_end->empty());

  auto* posix_file = dynamic_cast<PosixFile*>(file.get());
  ASSERT_NE(posix_file, nullptr);
  EXPECT_EQ(posix_file->metrics().write_bytes.load(), 10u);
  EXPECT_EQ(posix_file->metrics().read_count.load(), 4u);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, PwritevSyncTruncate)
{
  PosixIoOptions options;
  options.sync_data_only = true;

  PosixIO io{options};
  std::shared_ptr<File> file = this->open(io);

  const std::string a = "abc", b = "defgh";
  StatusOr<Completion> c =
      file->pwritev(2,
                    {IoBuffer::allocate_from(litepage::ConstBuffer{a.data(), a.size()}),
                     IoBuffer::allocate_from(litepage::ConstBuffer{b.data(), b.size()})},
                    Completion::new_write(nullptr));
  ASSERT_TRUE(c.ok()) << c.status();
  EXPECT_EQ(**c->result(), 8);
  EXPECT_THAT(*this->read_string(*file, 2, 8), ::testing::StrEq("abcdefgh"));

  StatusOr<Completion> synced = file->sync(Completion::new_sync(nullptr));
  ASSERT_TRUE(synced.ok()) << synced.status();
  EXPECT_TRUE(synced->result()->ok());
  EXPECT_TRUE(io.wait_for_completion(*synced).ok());

  StatusOr<Completion> truncated = file->truncate(4, Completion::new_truncate(nullptr));
  ASSERT_TRUE(truncated.ok()) << truncated.status();
  EXPECT_TRUE(truncated->result()->ok());
  EXPECT_EQ(*file->size(), 4u);
  EXPECT_EQ(*this->read_string(*file, 0, 10), std::string("\0\0ab", 4));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, ReadOnlyOpen)
{
  PosixIO io;
  {
    std::shared_ptr<File> writer = this->open(io);
    ASSERT_TRUE(this->write_string(*writer, 0, "stored").ok());
  }

  std::shared_ptr<File> reader = this->open(io, OpenFlags::kReadOnly);

  StatusOr<i32> n_written = this->write_string(*reader, 0, "x");
  EXPECT_EQ(n_written.status(), batt::status_from_errno(EBADF));
  EXPECT_THAT(*this->read_string(*reader, 0, 6), ::testing::StrEq("stored"));
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, LockFile)
{
  PosixIO io;
  std::shared_ptr<File> a = this->open(io);
  std::shared_ptr<File> b = this->open(io);

  EXPECT_TRUE(a->lock_file().ok());
  EXPECT_EQ(b->lock_file(), litepage::make_status(litepage::StatusCode::kFileLockConflict));

  EXPECT_TRUE(a->unlock_file().ok());
  EXPECT_TRUE(b->lock_file().ok());

  PosixIoOptions locking_options;
  locking_options.lock_on_open = true;

  PosixIO locking_io{locking_options};
  EXPECT_EQ(locking_io.open_file(this->file_name).status(),
            litepage::make_status(litepage::StatusCode::kFileLockConflict));

  EXPECT_TRUE(b->unlock_file().ok());
  EXPECT_TRUE(locking_io.open_file(this->file_name).ok());
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TEST_F(PosixIOTest, RemoveFile)
{
  PosixIO io;
  this->open(io);

  EXPECT_TRUE(std::filesystem::exists(this->file_name));
  EXPECT_TRUE(io.remove_file(this->file_name).ok());
  EXPECT_FALSE(std::filesystem::exists(this->file_name));
}

}  // namespace

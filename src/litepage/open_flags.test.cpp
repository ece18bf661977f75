//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/open_flags.hpp>
//
#include <litepage/open_flags.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

using litepage::OpenFlags;

TEST(OpenFlagsTest, IndividualFlags)
{
  EXPECT_EQ(OpenFlags::kNone.bits(), 0);
  EXPECT_EQ(OpenFlags::kCreate.bits(), 1);
  EXPECT_EQ(OpenFlags::kReadOnly.bits(), 2);
}

TEST(OpenFlagsTest, CombinedFlags)
{
  const OpenFlags combined = OpenFlags::kCreate | OpenFlags::kReadOnly;

  EXPECT_EQ(combined.bits(), 3);
  EXPECT_TRUE(combined.contains(OpenFlags::kCreate));
  EXPECT_TRUE(combined.contains(OpenFlags::kReadOnly));
  EXPECT_TRUE(combined.contains(OpenFlags::kNone));

  EXPECT_FALSE(OpenFlags::kCreate.contains(OpenFlags::kReadOnly));
  EXPECT_EQ(combined & OpenFlags::kReadOnly, OpenFlags::kReadOnly);

  OpenFlags flags = OpenFlags::kNone;
  flags |= OpenFlags::kReadOnly;
  EXPECT_EQ(flags, OpenFlags::kReadOnly);

  EXPECT_THAT(batt::to_string(combined), ::testing::StrEq("OpenFlags{Create,ReadOnly,}"));
}

TEST(OpenFlagsTest, DefaultIsCreate)
{
  EXPECT_EQ(OpenFlags{}, OpenFlags::kCreate);
  EXPECT_NE(OpenFlags{}, OpenFlags::kReadOnly);
}

}  // namespace

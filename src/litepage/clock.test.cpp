//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/clock.hpp>
//
#include <litepage/clock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <batteries/stream_util.hpp>

namespace {

using litepage::Instant;

TEST(ClockTest, InstantToSystemTime)
{
  const auto epoch = std::chrono::system_clock::time_point{};

  EXPECT_EQ((Instant{0, 0}.to_system_time()), epoch);
  EXPECT_EQ((Instant{10, 500}.to_system_time()),
            epoch + std::chrono::seconds{10} + std::chrono::microseconds{500});

  // 1.25 seconds before the epoch is {-2, 750000}.
  //
  EXPECT_EQ((Instant{-2, 750000}.to_system_time()), epoch - std::chrono::microseconds{1250000});
  EXPECT_EQ((Instant{-1, 0}.to_system_time()), epoch - std::chrono::seconds{1});
}

TEST(ClockTest, InstantFromSystemTime)
{
  const auto epoch = std::chrono::system_clock::time_point{};

  EXPECT_EQ(litepage::instant_from_system_time(epoch + std::chrono::microseconds{3000001}),
            (Instant{3, 1}));
  EXPECT_EQ(litepage::instant_from_system_time(epoch - std::chrono::microseconds{1250000}),
            (Instant{-2, 750000}));

  EXPECT_THAT(batt::to_string(Instant{3, 1}), ::testing::StrEq("Instant{3.000001}"));
}

TEST(ClockTest, SystemClockIsMonotonicEnough)
{
  litepage::SystemClock clock;

  const Instant before = clock.now();
  const Instant after = clock.now();

  EXPECT_GT(before.secs, 0);
  EXPECT_LT(before.micros, 1000000u);
  EXPECT_LE(before.to_system_time(), after.to_system_time() + std::chrono::seconds{1});
}

}  // namespace

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_CLOCK_HPP
#define LITEPAGE_CLOCK_HPP

#include <litepage/int_types.hpp>

#include <chrono>
#include <ostream>

namespace litepage {

// A wall-clock point in time, relative to the Unix epoch.  `secs` may be negative (times before
// 1970); `micros` is always the non-negative sub-second part, so that the represented time is
// `secs + micros / 1e6`.
//
struct Instant {
  i64 secs;
  u32 micros;

  std::chrono::system_clock::time_point to_system_time() const;
};

std::ostream& operator<<(std::ostream& out, const Instant& t);

inline bool operator==(const Instant& l, const Instant& r)
{
  return l.secs == r.secs && l.micros == r.micros;
}

inline bool operator!=(const Instant& l, const Instant& r)
{
  return !(l == r);
}

Instant instant_from_system_time(std::chrono::system_clock::time_point t);

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class Clock
{
 public:
  Clock(const Clock&) = delete;
  Clock& operator=(const Clock&) = delete;

  virtual ~Clock() = default;

  virtual Instant now() const = 0;

 protected:
  Clock() = default;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
class SystemClock : public Clock
{
 public:
  SystemClock() = default;

  Instant now() const override;
};

}  // namespace litepage

#endif  // LITEPAGE_CLOCK_HPP

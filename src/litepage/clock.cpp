//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <litepage/clock.hpp>
//

#include <iomanip>

namespace litepage {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::chrono::system_clock::time_point Instant::to_system_time() const
{
  return std::chrono::system_clock::time_point{} + std::chrono::seconds{this->secs} +
         std::chrono::microseconds{this->micros};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Instant instant_from_system_time(std::chrono::system_clock::time_point t)
{
  const i64 total_micros =
      std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();

  // Floor division, so micros stays in [0, 1e6) for times before the epoch.
  //
  i64 secs = total_micros / 1000000;
  i64 micros = total_micros % 1000000;
  if (micros < 0) {
    secs -= 1;
    micros += 1000000;
  }
  return Instant{secs, static_cast<u32>(micros)};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const Instant& t)
{
  return out << "Instant{" << t.secs << "." << std::setw(6) << std::setfill('0') << t.micros
             << std::setfill(' ') << "}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
Instant SystemClock::now() const
{
  return instant_from_system_time(std::chrono::system_clock::now());
}

}  // namespace litepage

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef LITEPAGE_LOGGING_HPP
#define LITEPAGE_LOGGING_HPP

#include <litepage/config.hpp>

#include <ostream>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LITEPAGE_DISABLE_LOGGING)

// Nothing to include!

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LITEPAGE_USE_GLOG)

#include <glog/logging.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LITEPAGE_USE_BOOST_LOG)

#include <batteries/assert.hpp>
#include <batteries/suppress.hpp>

BATT_SUPPRESS_IF_GCC("-Wdeprecated-copy")

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

BATT_UNSUPPRESS_IF_GCC()

#include <errno.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#else

#error No Logging Impl Selected!

#endif

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

namespace litepage {

namespace detail {
struct NullStream {
  template <typename Arg>
  const NullStream& operator<<(Arg&&) const noexcept
  {
    return *this;
  }

  const NullStream& operator<<(std::ostream& (*)(std::ostream&)) const noexcept
  {
    return *this;
  }
};
}  // namespace detail

#define LITEPAGE_LOG_NO_OUTPUT()                                                                   \
  if (false)                                                                                       \
  (::litepage::detail::NullStream{})

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LITEPAGE_DISABLE_LOGGING)

#define LITEPAGE_LOG_ERROR() LITEPAGE_LOG_NO_OUTPUT()
#define LITEPAGE_LOG_WARNING() LITEPAGE_LOG_NO_OUTPUT()
#define LITEPAGE_LOG_INFO() LITEPAGE_LOG_NO_OUTPUT()
#define LITEPAGE_VLOG(verbosity) LITEPAGE_LOG_NO_OUTPUT()
#define LITEPAGE_PLOG_WARNING() LITEPAGE_LOG_NO_OUTPUT()

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LITEPAGE_USE_GLOG)

#define LITEPAGE_LOG_ERROR() LOG(ERROR)
#define LITEPAGE_LOG_WARNING() LOG(WARNING)
#define LITEPAGE_LOG_INFO() LOG(INFO)
#define LITEPAGE_VLOG(verbosity) VLOG((verbosity))
#define LITEPAGE_PLOG_WARNING() PLOG(WARNING)

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LITEPAGE_USE_BOOST_LOG)

#define LITEPAGE_LOG_ERROR() BOOST_LOG_TRIVIAL(error)
#define LITEPAGE_LOG_WARNING() BOOST_LOG_TRIVIAL(warning)
#define LITEPAGE_LOG_INFO() BOOST_LOG_TRIVIAL(info)
#define LITEPAGE_VLOG(verbosity) BOOST_LOG_TRIVIAL(debug)
#define LITEPAGE_PLOG_WARNING() LITEPAGE_LOG_WARNING() << BATT_INSPECT(errno)

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -

inline const bool kBoostLoggingInitialized = [] {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= boost::log::trivial::info);
  return true;
}();

#endif

//+++++++++++-+-+--+----- --- -- -  -  -   -

#define LITEPAGE_DLOG_WARNING()                                                                    \
  if (::litepage::kDebugBuild)                                                                     \
  LITEPAGE_LOG_WARNING()

#define LITEPAGE_DVLOG(verbosity)                                                                  \
  if (::litepage::kDebugBuild)                                                                     \
  LITEPAGE_VLOG((verbosity))

}  // namespace litepage

#endif  // LITEPAGE_LOGGING_HPP

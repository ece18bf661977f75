//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_STATUS_HPP
#define LITEPAGE_STATUS_HPP

#include <litepage/logging.hpp>
#include <litepage/status_code.hpp>

#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace litepage {

using batt::OkStatus;
using batt::Status;
using batt::status_from_errno;
using batt::status_from_retval;
using batt::StatusOr;

#define LITEPAGE_WARN_IF_NOT_OK(expr)                                                              \
  for (auto BOOST_PP_CAT(litepage_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));      \
       BATT_HINT_FALSE(BOOST_PP_CAT(litepage_TmpStatusResult, __LINE__) &&                         \
                       !BOOST_PP_CAT(litepage_TmpStatusResult, __LINE__)->ok());                   \
       BOOST_PP_CAT(litepage_TmpStatusResult, __LINE__) = ::batt::None)                            \
  LITEPAGE_LOG_WARNING() << "Expected OK result, but got: \n\n"                                    \
                         << BOOST_PP_STRINGIZE((expr)) << " == "                                   \
                         << BOOST_PP_CAT(litepage_TmpStatusResult, __LINE__) << "\n\n"

}  // namespace litepage

#endif  // LITEPAGE_STATUS_HPP

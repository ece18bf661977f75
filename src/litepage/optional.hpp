//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_OPTIONAL_HPP
#define LITEPAGE_OPTIONAL_HPP

#include <batteries/optional.hpp>

namespace litepage {

using ::batt::make_optional;
using ::batt::None;
using ::batt::NoneType;
using ::batt::Optional;

}  // namespace litepage

#endif  // LITEPAGE_OPTIONAL_HPP

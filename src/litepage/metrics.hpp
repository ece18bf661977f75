//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LitePage Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LITEPAGE_METRICS_HPP
#define LITEPAGE_METRICS_HPP

#include <batteries/metrics/metric_collectors.hpp>

namespace litepage {

using ::batt::CountMetric;
using ::batt::FastCountMetric;

}  // namespace litepage

#endif  // LITEPAGE_METRICS_HPP

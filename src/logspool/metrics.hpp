//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_METRICS_HPP
#define LOGSPOOL_METRICS_HPP

#include <batteries/metrics/metric_collectors.hpp>
#include <batteries/metrics/metric_registry.hpp>

namespace logspool {

using ::batt::CountMetric;
using ::batt::global_metric_registry;
using ::batt::LatencyMetric;
using ::batt::LatencyTimer;
using ::batt::MetricLabel;
using ::batt::MetricLabelSet;
using ::batt::MetricRegistry;

}  // namespace logspool

#endif  // LOGSPOOL_METRICS_HPP

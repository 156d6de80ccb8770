//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_WRITER_METRICS_HPP
#define LOGSPOOL_WRITER_METRICS_HPP

#include <logspool/int_types.hpp>
#include <logspool/metrics.hpp>

#include <ostream>

namespace logspool {

// Process-wide counters shared by all Writer instances; see Writer::metrics().
//
struct WriterMetrics {
  CountMetric<u64> closed_file_count{0};

  // Total uncompressed bytes written to files before they were closed.
  //
  CountMetric<u64> closed_file_bytes{0};

  // Time spent flushing and closing output files.
  //
  LatencyMetric close_latency;

  CountMetric<u64> corrupted_file_count{0};

  CountMetric<u64> version_bump_count{0};

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  void export_to(MetricRegistry& registry, const MetricLabelSet& labels) noexcept;

  void unexport_from(MetricRegistry& registry) noexcept;
};

std::ostream& operator<<(std::ostream& out, const WriterMetrics& t);

}  // namespace logspool

#endif  // LOGSPOOL_WRITER_METRICS_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFERS_METRICS_HPP
#define LOGSPOOL_BUFFERS_METRICS_HPP

#include <logspool/int_types.hpp>
#include <logspool/metrics.hpp>

#include <ostream>

namespace logspool {

struct BuffersMetrics {
  /** \brief The number of successful calls to Buffers::put.
   */
  CountMetric<u64> put_count{0};

  /** \brief Total record bytes accepted by Buffers::put.
   */
  CountMetric<u64> put_bytes{0};

  /** \brief The number of buffers moved to the ready queue (because they were full or flushed).
   */
  CountMetric<u64> enclosed_count{0};

  /** \brief The ready queue backlog, sampled at the start of each drain.
   */
  CountMetric<u64> ready_buffer_count{0};

  /** \brief The number of ready buffers accepted by a consumer and returned to the cache.
   */
  CountMetric<u64> drained_count{0};

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Exports all collectors in this object to the passed registry, adding the passed labels.
   *
   * IMPORTANT: Once export_to has been called, this->unexport_from(registry) must be called before
   * this object goes out of scope!
   */
  void export_to(MetricRegistry& registry, const MetricLabelSet& labels) noexcept;

  void unexport_from(MetricRegistry& registry) noexcept;
};

std::ostream& operator<<(std::ostream& out, const BuffersMetrics& t);

}  // namespace logspool

#endif  // LOGSPOOL_BUFFERS_METRICS_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffers_metrics.hpp>
//

#include <batteries/operators.hpp>
#include <batteries/utility.hpp>

#include <boost/preprocessor/stringize.hpp>

namespace logspool {

BATT_OBJECT_PRINT_IMPL((), BuffersMetrics,
                       (put_count, put_bytes, enclosed_count, ready_buffer_count, drained_count))

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void BuffersMetrics::export_to(MetricRegistry& registry, const MetricLabelSet& labels) noexcept
{
#define LOGSPOOL_EXPORT_METRIC_(name)                                                              \
  registry.add("Buffers_" BOOST_PP_STRINGIZE(name), this->name, batt::make_copy(labels))

  LOGSPOOL_EXPORT_METRIC_(put_count);
  LOGSPOOL_EXPORT_METRIC_(put_bytes);
  LOGSPOOL_EXPORT_METRIC_(enclosed_count);
  LOGSPOOL_EXPORT_METRIC_(ready_buffer_count);
  LOGSPOOL_EXPORT_METRIC_(drained_count);

#undef LOGSPOOL_EXPORT_METRIC_
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void BuffersMetrics::unexport_from(MetricRegistry& registry) noexcept
{
  registry  //
      .remove(this->put_count)
      .remove(this->put_bytes)
      .remove(this->enclosed_count)
      .remove(this->ready_buffer_count)
      .remove(this->drained_count);
}

}  // namespace logspool

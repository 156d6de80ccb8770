//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/writer_metrics.hpp>
//

#include <batteries/utility.hpp>

#include <boost/preprocessor/stringize.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void WriterMetrics::export_to(MetricRegistry& registry, const MetricLabelSet& labels) noexcept
{
#define LOGSPOOL_EXPORT_METRIC_(name)                                                              \
  registry.add("Writer_" BOOST_PP_STRINGIZE(name), this->name, batt::make_copy(labels))

  LOGSPOOL_EXPORT_METRIC_(closed_file_count);
  LOGSPOOL_EXPORT_METRIC_(closed_file_bytes);
  LOGSPOOL_EXPORT_METRIC_(close_latency);
  LOGSPOOL_EXPORT_METRIC_(corrupted_file_count);
  LOGSPOOL_EXPORT_METRIC_(version_bump_count);

#undef LOGSPOOL_EXPORT_METRIC_
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
void WriterMetrics::unexport_from(MetricRegistry& registry) noexcept
{
  registry  //
      .remove(this->closed_file_count)
      .remove(this->closed_file_bytes)
      .remove(this->close_latency)
      .remove(this->corrupted_file_count)
      .remove(this->version_bump_count);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const WriterMetrics& t)
{
  return out << "WriterMetrics{.closed_file_count=" << t.closed_file_count.load()
             << ", .closed_file_bytes=" << t.closed_file_bytes.load()
             << ", .corrupted_file_count=" << t.corrupted_file_count.load()
             << ", .version_bump_count=" << t.version_bump_count.load() << ",}";
}

}  // namespace logspool

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/writer_options.hpp>
//

#include <logspool/logging.hpp>

#include <batteries/env.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ WriterOptions WriterOptions::with_default_values()
{
  static const std::chrono::milliseconds refresh_interval = [] {
    const char* const varname = "LOGSPOOL_WRITER_REFRESH_INTERVAL_MS";

    const i64 value_ms =
        batt::getenv_as<i64>(varname).value_or(kDefaultRefreshInterval.count());

    if (value_ms <= 0) {
      LOGSPOOL_LOG_WARNING() << varname << "=" << value_ms
                             << " is not positive; using the default";
      return kDefaultRefreshInterval;
    }
    LOGSPOOL_VLOG(1) << varname << "=" << value_ms;

    return std::chrono::milliseconds{value_ms};
  }();

  WriterOptions options;
  options.set_refresh_interval(refresh_interval);

  return options;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
WriterOptions::WriterOptions() noexcept
    : timestamp_{Timestamp::kBph12}
    , clock_{[] {
      return std::chrono::system_clock::now();
    }}
{
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const WriterOptions& t)
{
  return out << "WriterOptions{.buffer_size=" << t.buffer_size()
             << ", .timestamp=" << t.timestamp()
             << ", .refresh_interval=" << t.refresh_interval().count() << "ms,}";
}

}  // namespace logspool

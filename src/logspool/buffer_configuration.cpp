//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool/buffer_configuration.hpp>
//

#include <batteries/stream_util.hpp>

namespace logspool {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BufferConfiguration BufferConfiguration::from_pattern(std::string_view pattern_text,
                                                      usize buffer_size)
{
  return BufferConfiguration{
      .pattern_text = std::string{pattern_text},
      .pattern = std::regex{pattern_text.begin(), pattern_text.end()},
      .buffer_size = buffer_size,
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::ostream& operator<<(std::ostream& out, const BufferConfiguration& t)
{
  return out << "BufferConfiguration{.pattern=" << batt::c_str_literal(t.pattern_text)
             << ", .buffer_size=" << t.buffer_size << ",}";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BufferConfigurationMap& BufferConfigurationMap::add(std::string name, BufferConfiguration config)
{
  this->entries_.emplace_back(std::move(name), std::move(config));
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<const BufferConfiguration*> BufferConfigurationMap::find(std::string_view log_type) const
{
  for (const Entry& entry : this->entries_) {
    if (std::regex_search(log_type.begin(), log_type.end(), entry.second.pattern)) {
      return &entry.second;
    }
  }

  return {make_status(StatusCode::kNoBufferConfiguration)};
}

}  // namespace logspool

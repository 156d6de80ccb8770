//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_BUFFER_CONFIGURATION_HPP
#define LOGSPOOL_BUFFER_CONFIGURATION_HPP

#include <logspool/int_types.hpp>
#include <logspool/status.hpp>

#include <ostream>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logspool {

/** \brief The buffer capacity used for log types that match `pattern`.
 */
struct BufferConfiguration {
  // Source text of `pattern`, kept for logging.
  //
  std::string pattern_text;

  std::regex pattern;

  usize buffer_size;

  static BufferConfiguration from_pattern(std::string_view pattern_text, usize buffer_size);
};

std::ostream& operator<<(std::ostream& out, const BufferConfiguration& t);

/** \brief An ordered list of named BufferConfigurations.
 */
class BufferConfigurationMap
{
 public:
  using Entry = std::pair<std::string, BufferConfiguration>;

  BufferConfigurationMap() = default;

  /** \brief Appends a configuration; entries added first take precedence.
   */
  BufferConfigurationMap& add(std::string name, BufferConfiguration config);

  BufferConfigurationMap& add(std::string name, std::string_view pattern_text, usize buffer_size)
  {
    return this->add(std::move(name), BufferConfiguration::from_pattern(pattern_text, buffer_size));
  }

  /** \brief Returns the first configuration whose pattern occurs in `log_type`; fails with
   * kNoBufferConfiguration if there is none.
   */
  StatusOr<const BufferConfiguration*> find(std::string_view log_type) const;

  const std::vector<Entry>& entries() const noexcept
  {
    return this->entries_;
  }

  usize size() const noexcept
  {
    return this->entries_.size();
  }

 private:
  std::vector<Entry> entries_;
};

}  // namespace logspool

#endif  // LOGSPOOL_BUFFER_CONFIGURATION_HPP

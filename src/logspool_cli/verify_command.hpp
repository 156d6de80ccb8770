//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_CLI_VERIFY_COMMAND_HPP
#define LOGSPOOL_CLI_VERIFY_COMMAND_HPP

#include <CLI/App.hpp>

#include <logspool/int_types.hpp>

#include <string>
#include <vector>

namespace logspool_cli {

using namespace logspool::int_types;

CLI::App* add_verify_command(CLI::App* app);

struct VerifyCommandArgs {
  std::vector<std::string> files;
};

/** \brief Checks that each log file decodes completely and prints its header line.
 *
 * \return the number of files that are corrupted or unreadable
 */
usize run_verify_command(const VerifyCommandArgs& args);

}  // namespace logspool_cli

#endif  // LOGSPOOL_CLI_VERIFY_COMMAND_HPP

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LOGSPOOL_CLI_CHECKPOINT_COMMAND_HPP
#define LOGSPOOL_CLI_CHECKPOINT_COMMAND_HPP

#include <CLI/App.hpp>

#include <logspool/int_types.hpp>

#include <string>
#include <vector>

namespace logspool_cli {

using namespace logspool::int_types;

CLI::App* add_checkpoint_command(CLI::App* app);

struct CheckpointCommandArgs {
  std::vector<std::string> files;
};

/** \brief Prints one line per ready buffer stored in each checkpoint file.
 *
 * \return the number of files that could not be loaded
 */
usize run_checkpoint_command(const CheckpointCommandArgs& args);

}  // namespace logspool_cli

#endif  // LOGSPOOL_CLI_CHECKPOINT_COMMAND_HPP

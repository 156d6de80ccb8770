//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

//######=###=##=#=#=#=#=#==#==#====#+==#+==============+==+==+==+=+==+=+=+=+=+=+=+
// LogSpool Command-Line Interface.
//

#include <logspool_cli/checkpoint_command.hpp>
#include <logspool_cli/verify_command.hpp>

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>

#include <logspool/config.hpp>
#include <logspool/status_code.hpp>

#include <glog/logging.h>

#include <iostream>

int main(int argc, char** argv)
{
  google::InitGoogleLogging(argv[0]);
  logspool::initialize_status_codes();

  CLI::App app{"LogSpool Command Line Utility"};

  logspool_cli::add_checkpoint_command(&app);
  logspool_cli::add_verify_command(&app);

  app.require_subcommand();

  CLI11_PARSE(app, argc, argv);

  return 0;
}

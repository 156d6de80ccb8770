//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool_cli/checkpoint_command.hpp>
//

#include <logspool/checkpoint.hpp>
#include <logspool/log_buffer.hpp>

#include <batteries/stream_util.hpp>

#include <iomanip>
#include <iostream>
#include <memory>

namespace logspool_cli {

using namespace logspool;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
CLI::App* add_checkpoint_command(CLI::App* cmd)
{
  CLI::App* checkpoint_cmd =
      cmd->add_subcommand("checkpoint", "List the ready buffers saved in Buffers checkpoint files");

  auto args = std::make_shared<CheckpointCommandArgs>();

  checkpoint_cmd->add_option("files", args->files, "Checkpoint files to list.")
      ->required()
      ->check(CLI::ExistingFile);

  checkpoint_cmd->callback([args] {
    if (run_checkpoint_command(*args) != 0) {
      throw CLI::RuntimeError{1};
    }
  });

  return checkpoint_cmd;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize run_checkpoint_command(const CheckpointCommandArgs& args)
{
  usize failed_count = 0;

  std::cout << std::endl;

  for (const std::string& f : args.files) {
    std::cout << f << ":" << std::endl;

    StatusOr<std::vector<std::unique_ptr<LogBuffer>>> buffers = load_checkpoint(f);
    if (!buffers.ok()) {
      std::cout << "  error: " << buffers.status() << std::endl << std::endl;
      ++failed_count;
      continue;
    }

    usize total_payload = 0;
    for (const std::unique_ptr<LogBuffer>& buffer : *buffers) {
      const LogId& log_id = buffer->log_id();

      std::cout << std::setw(20) << std::setfill(' ') << buffer->id() << " "
                << batt::c_str_literal(log_id.log_type()) << " "
                << batt::c_str_literal(log_id.client_hostname()) << " shard=" << log_id.shard()
                << " capacity=" << buffer->capacity() << " payload=" << buffer->payload_size()
                << std::endl;

      total_payload += buffer->payload_size();
    }

    std::cout << "  " << buffers->size() << " buffer(s), " << total_payload << " payload byte(s)"
              << std::endl
              << std::endl;
  }

  return failed_count;
}

}  // namespace logspool_cli

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <logspool_cli/verify_command.hpp>
//

#include <logspool/file_encoding.hpp>
#include <logspool/log_metadata.hpp>

#include <batteries/stream_util.hpp>

#include <iostream>
#include <memory>

namespace logspool_cli {

using namespace logspool;

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
CLI::App* add_verify_command(CLI::App* cmd)
{
  CLI::App* verify_cmd = cmd->add_subcommand(
      "verify", "Check log files for corruption (.gz files must decompress completely)");

  auto args = std::make_shared<VerifyCommandArgs>();

  verify_cmd->add_option("files", args->files, "Log files to verify.")
      ->required()
      ->check(CLI::ExistingFile);

  verify_cmd->callback([args] {
    if (run_verify_command(*args) != 0) {
      throw CLI::RuntimeError{1};
    }
  });

  return verify_cmd;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize run_verify_command(const VerifyCommandArgs& args)
{
  usize bad_count = 0;

  for (const std::string& f : args.files) {
    const FileEncoding encoding = encoding_from_path(f);

    StatusOr<bool> valid = is_file_encoding_valid(f, encoding);
    if (!valid.ok()) {
      std::cout << f << ": error: " << valid.status() << std::endl;
      ++bad_count;
      continue;
    }
    if (!*valid) {
      std::cout << f << ": CORRUPTED (" << encoding << ")" << std::endl;
      ++bad_count;
      continue;
    }

    StatusOr<Optional<std::string>> header = read_header_line(f, encoding);
    if (!header.ok()) {
      std::cout << f << ": error: " << header.status() << std::endl;
      ++bad_count;
      continue;
    }

    std::cout << f << ": ok (" << encoding << ")";
    if (*header) {
      std::cout << " header=" << batt::c_str_literal(**header);
    } else {
      std::cout << " (no header line)";
    }

    StatusOr<LogMetadata> metadata = LogMetadata::read_for_file(f);
    if (metadata.ok()) {
      std::cout << " type=" << batt::c_str_literal(metadata->log_type)
                << " host=" << batt::c_str_literal(metadata->client_hostname)
                << " shard=" << metadata->shard;
    }
    std::cout << std::endl;
  }

  return bad_count;
}

}  // namespace logspool_cli

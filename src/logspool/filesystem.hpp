//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LogSpool Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

// Utilities for dealing with the OS filesystem.
//
#pragma once
#ifndef LOGSPOOL_FILESYSTEM_HPP
#define LOGSPOOL_FILESYSTEM_HPP

#include <logspool/buffer.hpp>
#include <logspool/int_types.hpp>
#include <logspool/status.hpp>

#include <batteries/strong_typedef.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace logspool {

namespace fs = std::filesystem;

BATT_STRONG_TYPEDEF(bool, CreateIfMissing);

StatusOr<int> open_file_read_only(std::string_view file_name);

// Opens `file_name` write-only with O_APPEND; fails if the file does not exist unless
// `create_if_missing` is true.
//
StatusOr<int> open_file_for_append(std::string_view file_name,
                                   CreateIfMissing create_if_missing = CreateIfMissing{true});

// Creates (or truncates) `file_name` for writing.
//
StatusOr<int> create_file_truncate(std::string_view file_name);

StatusOr<ConstBuffer> read_fd(int fd, MutableBuffer buffer, u64 offset);

// Writes all of `buffer` at the current file position of `fd`.
//
Status append_fd(int fd, ConstBuffer buffer);

Status write_fd(int fd, ConstBuffer buffer, u64 offset);

Status sync_fd(int fd);

Status close_fd(int fd);

Status delete_file(std::string_view file_name);

StatusOr<i64> sizeof_file(std::string_view file_name);

StatusOr<std::string> read_file_to_string(std::string_view file_name);

// Replaces the contents of `file_name` with `data` and fsyncs it.
//
Status write_file(std::string_view file_name, ConstBuffer data);

StatusOr<bool> file_exists(const fs::path& path);

// Creates every missing directory above `path`.
//
Status create_parent_directories(const fs::path& path);

// Renames `from` to `to`, creating the parent directories of `to` first.
//
Status move_file(const fs::path& from, const fs::path& to);

Status status_from_error_code(const std::error_code& ec);

}  // namespace logspool

#endif  // LOGSPOOL_FILESYSTEM_HPP

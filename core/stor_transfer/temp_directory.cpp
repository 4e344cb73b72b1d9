// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "temp_directory.hpp"

#include <random>
#include <system_error>

#define STOR_LOG_COMPONENT "temp_directory"
#include <stor_log_macros.hpp>

namespace fs = std::filesystem;

namespace stor {
namespace transfer {

using logging::kv;

namespace {

constexpr int MAX_CREATE_ATTEMPTS = 100;

std::string random_suffix() {
  static const char chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<size_t> dist(0, sizeof(chars) - 2);
  std::string suffix;
  for (int i = 0; i < 8; ++i) {
    suffix += chars[dist(rng)];
  }
  return suffix;
}

}  // namespace

TemporaryDirectory::TemporaryDirectory(const TempDirOptions& options) {
  fs::path parent = options.parent_dir.empty() ? fs::temp_directory_path() : fs::path(options.parent_dir);

  std::error_code ec;
  for (int attempt = 0; attempt < MAX_CREATE_ATTEMPTS; ++attempt) {
    fs::path candidate = parent / (options.prefix + random_suffix());
    // create_directory returns false without error when the name is taken
    if (fs::create_directory(candidate, ec)) {
      path_ = candidate;
      break;
    }
    if (ec) {
      throw fs::filesystem_error("Failed to create temporary directory", candidate, ec);
    }
  }
  if (path_.empty()) {
    throw fs::filesystem_error(
      "No unique temporary directory name", parent, std::make_error_code(std::errc::file_exists)
    );
  }

  if (options.change_dir) {
    try {
      previous_cwd_ = fs::current_path();
      fs::current_path(path_);
    } catch (const fs::filesystem_error&) {
      previous_cwd_.reset();
      fs::remove_all(path_, ec);
      throw;
    }
  }

  STOR_LOG_DEBUG(
    "Created temporary directory" << kv("path", path_.string())
                                  << kv("change_dir", options.change_dir)
  );
}

TemporaryDirectory::~TemporaryDirectory() {
  if (closed_) {
    return;
  }
  try {
    close();
  } catch (const std::exception& e) {
    STOR_LOG_ERROR(
      "Failed to clean up temporary directory" << kv("path", path_.string())
                                               << kv("error", e.what())
    );
  }
}

void TemporaryDirectory::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  // The directory is removed even when the old cwd is gone; the restore
  // error is reported after that
  std::error_code restore_ec;
  fs::path restore;
  if (previous_cwd_) {
    restore = *previous_cwd_;
    previous_cwd_.reset();
    fs::current_path(restore, restore_ec);
  }

  std::error_code ec;
  fs::remove_all(path_, ec);

  if (restore_ec) {
    STOR_LOG_WARN(
      "Could not restore working directory" << kv("path", restore.string())
                                            << kv("error", restore_ec.message())
    );
    throw fs::filesystem_error("Failed to restore working directory", restore, restore_ec);
  }
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw fs::filesystem_error("Failed to remove temporary directory", path_, ec);
  }
}

}  // namespace transfer
}  // namespace stor

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "local_filesystem.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include "stor_errors.hpp"

#define STOR_LOG_COMPONENT "local_fs"
#include <stor_log_macros.hpp>

namespace fs = std::filesystem;

namespace stor {
namespace transfer {

using logging::kv;

namespace {

constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

uint64_t pump(std::istream& in, std::ostream& out, const std::string& key) {
  std::vector<char> buffer(COPY_BUFFER_SIZE);
  uint64_t total = 0;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = in.gcount();
    if (got <= 0) {
      break;
    }
    out.write(buffer.data(), got);
    if (!out) {
      throw BackendError(key, "Write failed", "WriteError");
    }
    total += static_cast<uint64_t>(got);
  }
  if (in.bad()) {
    throw BackendError(key, "Read failed", "ReadError");
  }
  return total;
}

BackendError from_error_code(const std::string& key, const std::error_code& ec) {
  return BackendError(key, ec.message(), std::to_string(ec.value()));
}

}  // namespace

void make_dest_dir(const std::string& path) {
  std::error_code ec;
  fs::path target(path);

  if (fs::exists(target, ec)) {
    if (fs::is_directory(target, ec)) {
      return;
    }
    throw DirectoryConflict(path, EEXIST, "File exists");
  }

  // Find a parent component that is a regular file before creating anything
  fs::path prefix;
  for (const auto& component : target) {
    prefix /= component;
    if (prefix == target) {
      break;
    }
    if (fs::exists(prefix, ec) && !fs::is_directory(prefix, ec)) {
      throw DirectoryConflict(path, ENOTDIR, "already exists as a file");
    }
  }

  fs::create_directories(target, ec);
  if (ec) {
    if (ec == std::errc::not_a_directory) {
      throw DirectoryConflict(path, ENOTDIR, "already exists as a file");
    }
    if (ec == std::errc::file_exists && !fs::is_directory(target)) {
      throw DirectoryConflict(path, EEXIST, "File exists");
    }
    if (ec != std::errc::file_exists) {
      throw fs::filesystem_error("make_dest_dir", target, ec);
    }
  }
}

bool LocalFilesystemClient::exists(const Path& path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path.str(), ec));
}

bool LocalFilesystemClient::is_directory(const Path& path) {
  std::error_code ec;
  return fs::is_directory(fs::symlink_status(path.str(), ec));
}

std::vector<DirectoryEntry> LocalFilesystemClient::list_children(const Path& path) {
  std::vector<DirectoryEntry> children;
  std::error_code ec;
  fs::directory_iterator it(path.str(), ec);
  if (ec) {
    throw from_error_code(path.str(), ec);
  }
  for (const auto& entry : it) {
    // Symlinks and special files are leaves
    bool directory = entry.is_directory(ec) && !entry.is_symlink(ec);
    children.push_back({path / entry.path().filename().string(), directory});
  }
  std::sort(children.begin(), children.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
    return a.path < b.path;
  });
  return children;
}

uint64_t LocalFilesystemClient::read_file(const Path& path, std::ostream& out) {
  std::ifstream in(path.str(), std::ios::binary);
  if (!in.is_open()) {
    throw BackendError(path.str(), "Cannot open file for reading", "NoSuchKey");
  }
  return pump(in, out, path.str());
}

uint64_t LocalFilesystemClient::write_file(const Path& path, std::istream& in) {
  make_dest_dir(path.parent().str());
  std::ofstream out(path.str(), std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw BackendError(path.str(), "Cannot open file for writing", "WriteError");
  }
  uint64_t bytes = pump(in, out, path.str());
  out.close();
  if (out.fail()) {
    throw BackendError(path.str(), "Failed to flush file", "WriteError");
  }
  STOR_LOG_DEBUG("Wrote file" << kv("path", path.str()) << kv("bytes", bytes));
  return bytes;
}

void LocalFilesystemClient::remove_file(const Path& path) {
  std::error_code ec;
  if (!fs::remove(path.str(), ec) && ec) {
    throw from_error_code(path.str(), ec);
  }
}

void LocalFilesystemClient::remove_directory(const Path& path) {
  std::error_code ec;
  if (!fs::remove(path.str(), ec) && ec) {
    throw from_error_code(path.str(), ec);
  }
}

void LocalFilesystemClient::make_directory(const Path& path) {
  make_dest_dir(path.str());
}

}  // namespace transfer
}  // namespace stor

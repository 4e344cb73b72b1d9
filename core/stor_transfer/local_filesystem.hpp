// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_LOCAL_FILESYSTEM_HPP
#define STOR_LOCAL_FILESYSTEM_HPP

#include <string>

#include "backend_client.hpp"

namespace stor {
namespace transfer {

/**
 * Create a directory and any missing parents.
 *
 * An existing directory is not an error.
 *
 * @throws DirectoryConflict with EEXIST if path is an existing non-directory
 * @throws DirectoryConflict with ENOTDIR if a parent component is a file
 * @throws std::filesystem::filesystem_error for other failures
 */
void make_dest_dir(const std::string& path);

/**
 * Backend client for posix and windows paths, built on std::filesystem.
 */
class LocalFilesystemClient : public IBackendClient {
public:
  bool exists(const Path& path) override;
  bool is_directory(const Path& path) override;
  std::vector<DirectoryEntry> list_children(const Path& path) override;
  uint64_t read_file(const Path& path, std::ostream& out) override;

  /// Parent directories are created with make_dest_dir
  uint64_t write_file(const Path& path, std::istream& in) override;

  void remove_file(const Path& path) override;
  void remove_directory(const Path& path) override;
  void make_directory(const Path& path) override;

  bool eventually_consistent() const override {
    return false;
  }

  const char* name() const override {
    return "local";
  }
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_LOCAL_FILESYSTEM_HPP

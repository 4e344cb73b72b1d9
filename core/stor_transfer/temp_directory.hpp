// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_TEMP_DIRECTORY_HPP
#define STOR_TEMP_DIRECTORY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace stor {
namespace transfer {

struct TempDirOptions {
  std::string parent_dir;   // Empty: std::filesystem::temp_directory_path()
  bool change_dir = false;  // chdir into the new directory until release
  std::string prefix = "stor_";
};

/**
 * Scoped temporary directory.
 *
 * Created with a unique name on construction and removed recursively on
 * close() or destruction. With change_dir the process working directory is
 * switched into it and restored before removal.
 *
 * At most one change_dir instance may be active per process since the
 * working directory is process-wide.
 */
class TemporaryDirectory {
public:
  /**
   * @throws std::filesystem::filesystem_error if the directory cannot be
   *         created or entered
   */
  explicit TemporaryDirectory(const TempDirOptions& options = {});

  /// Releases like close() but logs failures instead of throwing
  ~TemporaryDirectory();

  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
  TemporaryDirectory(TemporaryDirectory&&) = delete;
  TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

  /**
   * Restore the working directory (if changed) and remove the directory.
   * A directory that is already gone is not an error. Idempotent.
   *
   * @throws std::filesystem::filesystem_error on restore or removal failure
   */
  void close();

  bool closed() const {
    return closed_;
  }

private:
  std::filesystem::path path_;
  std::optional<std::filesystem::path> previous_cwd_;
  bool closed_ = false;
};

/**
 * Run body(path) inside a fresh temporary directory and return its result.
 * Cleanup runs on every exit path; an exception from body propagates.
 */
template<typename Body>
auto with_temp_directory(const TempDirOptions& options, Body&& body)
  -> decltype(body(std::declval<const std::filesystem::path&>())) {
  TemporaryDirectory dir(options);
  if constexpr (std::is_void<decltype(body(dir.path()))>::value) {
    body(dir.path());
    dir.close();
  } else {
    auto result = body(dir.path());
    dir.close();
    return result;
  }
}

}  // namespace transfer
}  // namespace stor

#endif  // STOR_TEMP_DIRECTORY_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_TREE_WALKER_HPP
#define STOR_TREE_WALKER_HPP

#include <set>
#include <string>
#include <vector>

#include "backend_client.hpp"
#include "stor_path.hpp"

namespace stor {
namespace transfer {

/**
 * One item to transfer. key is the '/'-separated path relative to the parent
 * of the walk root it was found under. directory marks an empty-directory
 * placeholder.
 */
struct ManifestEntry {
  Path source;
  std::string key;
  bool directory = false;

  bool operator<(const ManifestEntry& other) const {
    if (source != other.source) {
      return source < other.source;
    }
    return key < other.key;
  }
  bool operator==(const ManifestEntry& other) const {
    return source == other.source && key == other.key && directory == other.directory;
  }
};

using Manifest = std::set<ManifestEntry>;

/**
 * Enumerate every file and every empty directory under the given roots.
 *
 * A file root yields a single entry keyed by its basename. Symlinks and
 * special files are leaves.
 *
 * @throws std::invalid_argument if the roots span more than one path kind
 * @throws PathNotFound for the first root that does not exist; nothing is
 *         enumerated in that case
 * @throws BackendUnavailable if no client serves the roots' kind
 * @throws BackendError on listing failures
 */
Manifest walk_files_and_dirs(const std::vector<Path>& roots, const BackendRegistry& registry);

}  // namespace transfer
}  // namespace stor

#endif  // STOR_TREE_WALKER_HPP

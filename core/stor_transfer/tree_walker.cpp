// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "tree_walker.hpp"

#include <stdexcept>

#include "stor_errors.hpp"

#define STOR_LOG_COMPONENT "tree_walker"
#include <stor_log_macros.hpp>

namespace stor {
namespace transfer {

using logging::kv;

namespace {

std::string key_for(const Path& path, const Path& base) {
  auto relative = path.relative_to(base);
  if (!relative || relative->empty()) {
    return path.name();
  }
  return *relative;
}

void walk_directory(IBackendClient& client, const Path& root, Manifest& manifest) {
  const Path base = root.parent();
  std::vector<Path> pending{root};

  while (!pending.empty()) {
    Path dir = pending.back();
    pending.pop_back();

    auto children = client.list_children(dir);
    if (children.empty()) {
      manifest.insert({dir, key_for(dir, base), true});
      continue;
    }
    for (const auto& child : children) {
      if (child.directory) {
        pending.push_back(child.path);
      } else {
        manifest.insert({child.path, key_for(child.path, base), false});
        STOR_LOG_DEBUG_EVERY_N(
          1000, "Walking" << kv("root", root.str()) << kv("entries", manifest.size())
        );
      }
    }
  }
}

}  // namespace

Manifest walk_files_and_dirs(const std::vector<Path>& roots, const BackendRegistry& registry) {
  Manifest manifest;
  if (roots.empty()) {
    return manifest;
  }

  const PathKind kind = roots.front().kind();
  for (const auto& root : roots) {
    if (root.kind() != kind) {
      throw std::invalid_argument(
        std::string("Cannot walk paths of different kinds: ") + to_string(kind) + " and " +
        to_string(root.kind())
      );
    }
  }

  auto client = registry.client_for(kind);

  // Validate every root before enumerating any of them
  for (const auto& root : roots) {
    if (!client->exists(root)) {
      throw PathNotFound(root.str());
    }
  }

  for (const auto& root : roots) {
    if (client->is_directory(root)) {
      walk_directory(*client, root, manifest);
    } else {
      manifest.insert({root, root.name(), false});
    }
  }

  STOR_LOG_DEBUG(
    "Walk complete" << kv("roots", roots.size()) << kv("entries", manifest.size())
                    << kv("backend", client->name())
  );
  return manifest;
}

}  // namespace transfer
}  // namespace stor

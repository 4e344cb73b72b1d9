// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_BACKEND_CLIENT_HPP
#define STOR_BACKEND_CLIENT_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <ostream>
#include <vector>

#include "stor_path.hpp"

namespace stor {
namespace transfer {

/**
 * One child returned by IBackendClient::list_children
 */
struct DirectoryEntry {
  Path path;
  bool directory;
};

/**
 * Storage backend operations used by the walker and the transfer engine.
 *
 * Implementations report failures by throwing BackendError. Object stores
 * treat a directory as a key prefix; make_directory writes a placeholder
 * marker so empty directories survive a round trip.
 */
class IBackendClient {
public:
  virtual ~IBackendClient() = default;

  virtual bool exists(const Path& path) = 0;

  virtual bool is_directory(const Path& path) = 0;

  /**
   * Immediate children of a directory (or key prefix), not recursive.
   */
  virtual std::vector<DirectoryEntry> list_children(const Path& path) = 0;

  /**
   * Stream the contents of a file into out.
   * @return Number of bytes written to out
   */
  virtual uint64_t read_file(const Path& path, std::ostream& out) = 0;

  /**
   * Create or replace a file with the contents of in.
   * @return Number of bytes stored
   */
  virtual uint64_t write_file(const Path& path, std::istream& in) = 0;

  virtual void remove_file(const Path& path) = 0;

  /**
   * Remove an empty directory or directory marker.
   */
  virtual void remove_directory(const Path& path) = 0;

  /**
   * Create an empty directory (or its placeholder).
   */
  virtual void make_directory(const Path& path) = 0;

  /**
   * True when a written object may not be visible to exists() right away.
   */
  virtual bool eventually_consistent() const = 0;

  /// Short backend name for log context ("local", "s3")
  virtual const char* name() const = 0;
};

/**
 * Maps each path kind to the client that serves it.
 */
class BackendRegistry {
public:
  void register_client(PathKind kind, std::shared_ptr<IBackendClient> client);

  bool has_client(PathKind kind) const;

  /**
   * @throws BackendUnavailable if no client is registered for the kind
   */
  std::shared_ptr<IBackendClient> client_for(PathKind kind) const;
  std::shared_ptr<IBackendClient> client_for(const Path& path) const {
    return client_for(path.kind());
  }

  /**
   * Registry with LocalFilesystemClient serving posix and windows paths.
   */
  static BackendRegistry with_local_clients();

private:
  std::map<PathKind, std::shared_ptr<IBackendClient>> clients_;
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_BACKEND_CLIENT_HPP

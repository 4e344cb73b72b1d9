// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "backend_client.hpp"

#include "local_filesystem.hpp"
#include "stor_errors.hpp"

namespace stor {
namespace transfer {

void BackendRegistry::register_client(PathKind kind, std::shared_ptr<IBackendClient> client) {
  clients_[kind] = std::move(client);
}

bool BackendRegistry::has_client(PathKind kind) const {
  return clients_.count(kind) > 0;
}

std::shared_ptr<IBackendClient> BackendRegistry::client_for(PathKind kind) const {
  auto it = clients_.find(kind);
  if (it == clients_.end() || !it->second) {
    throw BackendUnavailable(std::string("No backend client registered for ") + to_string(kind));
  }
  return it->second;
}

BackendRegistry BackendRegistry::with_local_clients() {
  BackendRegistry registry;
  auto local = std::make_shared<LocalFilesystemClient>();
  registry.register_client(PathKind::posix, local);
  registry.register_client(PathKind::windows, local);
  return registry;
}

}  // namespace transfer
}  // namespace stor

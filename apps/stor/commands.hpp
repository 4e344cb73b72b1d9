// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_CLI_COMMANDS_HPP
#define STOR_CLI_COMMANDS_HPP

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "backend_client.hpp"
#include "batch_result.hpp"
#include "config_parser.hpp"
#include "stor_path.hpp"
#include "transfer_engine.hpp"

namespace stor {
namespace cli {

/// Exit status of a batch command with per-item failures
constexpr int EXIT_PARTIAL_FAILURE = 2;

/**
 * Command handler for the stor CLI
 */
class Commands {
public:
  explicit Commands(std::ostream& out = std::cout, std::ostream& err = std::cerr);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  void set_json(bool json) {
    json_ = json;
  }

  /**
   * Print "<kind>\t<normalized>" for every argument
   */
  int classify(const std::vector<std::string>& args);

  /**
   * Print the manifest of the given roots, one "<key>\t<source>" per line
   */
  int walk(const std::vector<std::string>& args);

  /**
   * Walk every source but the last argument and copy to the last argument
   */
  int run_transfer(transfer::TransferDirection direction, const std::vector<std::string>& args);

  int rmtree(const std::vector<std::string>& args);

  /**
   * Print the byte count of a size string such as "10M"
   */
  int size(const std::vector<std::string>& args);

  /**
   * Print the object key derived from a local file name
   */
  int objname(const std::vector<std::string>& args);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  /**
   * Registry with the local clients plus every object-store client the
   * build supports and the paths need.
   */
  transfer::BackendRegistry make_registry(const std::vector<Path>& paths) const;

#ifdef STOR_CLI_TESTING
  StorConfig& config() {
    return config_;
  }

  void set_registry(transfer::BackendRegistry registry) {
    registry_override_ = std::move(registry);
    has_registry_override_ = true;
  }
#endif

private:
  std::ostream& out_;
  std::ostream& err_;
  StorConfig config_;
  PathConvention convention_;
  bool verbose_;
  bool json_;

  transfer::BackendRegistry registry_override_;
  bool has_registry_override_;

  void print_usage();

  std::vector<Path> to_paths(const std::vector<std::string>& args) const;

  transfer::TransferOptions transfer_options(const std::string& batch_id) const;

  /**
   * Print the batch summary and map it to an exit status
   */
  int report(const transfer::BatchResult& result);
};

}  // namespace cli
}  // namespace stor

#endif  // STOR_CLI_COMMANDS_HPP

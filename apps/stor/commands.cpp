// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "path_utils.hpp"
#include "stor_errors.hpp"
#include "stor_log_init.hpp"
#include "tree_walker.hpp"

#ifdef STOR_HAS_S3
#include "s3_backend_client.hpp"
#include "s3_client.hpp"
#endif

#define STOR_LOG_COMPONENT "cli"
#include <stor_log_macros.hpp>

namespace stor {
namespace cli {

using logging::kv;
using transfer::BatchResult;
using transfer::TransferDirection;

namespace {

std::string make_batch_id(const std::string& command) {
  auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()
  );
  return command + "-" + std::to_string(now.count());
}

#ifdef STOR_HAS_S3
s3::S3Config to_s3_config(const S3Section& section) {
  s3::S3Config config;
  config.endpoint_url = section.endpoint_url;
  config.region = section.region;
  config.use_ssl = section.use_ssl;
  config.verify_ssl = section.verify_ssl;
  config.access_key = section.access_key;
  config.secret_key = section.secret_key;
  config.part_size = section.part_size;
  config.executor_thread_count = section.executor_thread_count;
  config.connect_timeout_ms = section.connect_timeout_ms;
  config.request_timeout_ms = section.request_timeout_ms;
  return config;
}
#endif

}  // namespace

Commands::Commands(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
    , convention_(host_convention())
    , verbose_(false)
    , json_(false)
    , has_registry_override_(false) {}

std::vector<Path> Commands::to_paths(const std::vector<std::string>& args) const {
  std::vector<Path> paths;
  paths.reserve(args.size());
  for (const auto& arg : args) {
    paths.emplace_back(arg, convention_);
  }
  return paths;
}

transfer::BackendRegistry Commands::make_registry(const std::vector<Path>& paths) const {
  if (has_registry_override_) {
    return registry_override_;
  }

  auto registry = transfer::BackendRegistry::with_local_clients();
#ifdef STOR_HAS_S3
  // The SDK is only initialized when a command touches S3
  bool needs_s3 = std::any_of(paths.begin(), paths.end(), [](const Path& p) {
    return p.kind() == PathKind::s3;
  });
  if (needs_s3) {
    auto client = std::make_shared<s3::S3Client>(to_s3_config(config_.s3));
    registry.register_client(PathKind::s3, std::make_shared<s3::S3BackendClient>(client));
  }
#else
  (void)paths;
#endif
  return registry;
}

transfer::TransferOptions Commands::transfer_options(const std::string& batch_id) const {
  transfer::TransferOptions options;
  convert_transfer_options(config_.transfer, options);
  options.batch_id = batch_id;
  return options;
}

int Commands::classify(const std::vector<std::string>& args) {
  if (args.empty()) {
    err_ << "Error: classify requires at least one path" << std::endl;
    return 1;
  }
  for (const auto& path : to_paths(args)) {
    out_ << path.kind() << "\t" << path.str() << std::endl;
  }
  return 0;
}

int Commands::walk(const std::vector<std::string>& args) {
  if (args.empty()) {
    err_ << "Error: walk requires at least one path" << std::endl;
    return 1;
  }
  auto roots = to_paths(args);
  auto manifest = transfer::walk_files_and_dirs(roots, make_registry(roots));

  for (const auto& entry : manifest) {
    out_ << entry.key << "\t" << entry.source.str();
    if (entry.directory) {
      out_ << "\t(dir)";
    }
    out_ << std::endl;
  }
  if (verbose_) {
    err_ << manifest.size() << " entries" << std::endl;
  }
  return 0;
}

int Commands::run_transfer(TransferDirection direction, const std::vector<std::string>& args) {
  if (args.size() < 2) {
    err_ << "Error: " << transfer::to_string(direction)
         << " requires at least one source and a destination" << std::endl;
    return 1;
  }

  auto paths = to_paths(args);
  Path destination = paths.back();
  paths.pop_back();

  std::vector<Path> all = paths;
  all.push_back(destination);
  auto registry = make_registry(all);

  auto manifest = transfer::walk_files_and_dirs(paths, registry);
  auto options = transfer_options(make_batch_id(transfer::to_string(direction)));

  STOR_LOG_INFO(
    "Running " << transfer::to_string(direction) << kv("sources", paths.size())
               << kv("entries", manifest.size()) << kv("batch_id", options.batch_id)
  );

  auto result = transfer::run_batch_transfer(manifest, destination, direction, registry, {}, options);
  return report(result);
}

int Commands::rmtree(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    err_ << "Error: rmtree requires exactly one path" << std::endl;
    return 1;
  }
  auto paths = to_paths(args);
  auto registry = make_registry(paths);

  auto result =
    transfer::remove_tree(paths.front(), registry, {}, transfer_options(make_batch_id("rmtree")));
  return report(result);
}

int Commands::size(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    err_ << "Error: size requires exactly one value" << std::endl;
    return 1;
  }
  out_ << parse_byte_size(args.front()) << std::endl;
  return 0;
}

int Commands::objname(const std::vector<std::string>& args) {
  if (args.empty()) {
    err_ << "Error: objname requires at least one path" << std::endl;
    return 1;
  }
  for (const auto& arg : args) {
    out_ << file_name_to_object_name(arg, convention_) << std::endl;
  }
  return 0;
}

int Commands::report(const BatchResult& result) {
  if (json_) {
    nlohmann::json doc;
    doc["succeeded"] = result.succeeded;
    doc["bytes"] = result.bytes;
    doc["failed"] = nlohmann::json::array();
    for (const auto& failure : result.failed) {
      doc["failed"].push_back({{"key", failure.first}, {"error", failure.second}});
    }
    out_ << doc.dump(2) << std::endl;
  } else {
    out_ << "Succeeded: " << result.succeeded << std::endl;
    out_ << "Failed: " << result.failed.size() << std::endl;
    out_ << "Bytes: " << result.bytes << std::endl;
    for (const auto& failure : result.failed) {
      err_ << "FAILED " << failure.first << ": " << failure.second << std::endl;
    }
  }
  return result.ok() ? 0 : EXIT_PARTIAL_FAILURE;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  // Parse flags; everything else is positional
  std::vector<std::string> args;
  std::string config_path;
  std::string workers;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        err_ << "Error: " << arg << " requires a file" << std::endl;
        return 1;
      }
      config_path = argv[++i];
    } else if (arg == "--workers" || arg == "-w") {
      if (i + 1 >= argc) {
        err_ << "Error: " << arg << " requires a number" << std::endl;
        return 1;
      }
      workers = argv[++i];
    } else if (arg == "--json") {
      json_ = true;
    } else if (arg == "--windows") {
      convention_ = PathConvention::windows;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else {
      args.push_back(arg);
    }
  }

  if (!config_path.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_path, config_)) {
      err_ << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  if (!workers.empty()) {
    try {
      config_.transfer.workers = static_cast<size_t>(std::stoul(workers));
    } catch (const std::exception&) {
      err_ << "Error: invalid worker count '" << workers << "'" << std::endl;
      return 1;
    }
  }
  if (verbose_) {
    config_.logging.level = "debug";
  }

  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    err_ << "Error: " << error_msg << std::endl;
    return 1;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config_.logging, log_config);
  logging::reconfigure_logging(log_config);

  try {
    if (command == "classify") {
      return classify(args);
    } else if (command == "walk") {
      return walk(args);
    } else if (command == "upload") {
      return run_transfer(TransferDirection::upload, args);
    } else if (command == "download") {
      return run_transfer(TransferDirection::download, args);
    } else if (command == "copy") {
      return run_transfer(TransferDirection::copy, args);
    } else if (command == "rmtree") {
      return rmtree(args);
    } else if (command == "size") {
      return size(args);
    } else if (command == "objname") {
      return objname(args);
    } else {
      err_ << "Error: Unknown command '" << command << "'" << std::endl;
      print_usage();
      return 1;
    }
  } catch (const transfer::PartialBatchFailure& e) {
    return report(e.result());
  } catch (const DirectoryConflict& e) {
    err_ << "Error: " << e.what() << " (" << e.path() << ")" << std::endl;
    return 1;
  } catch (const StorError& e) {
    err_ << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument& e) {
    err_ << "Error: " << e.what() << std::endl;
    return 1;
  }
}

void Commands::print_usage() {
  out_ << "stor - Local and object-store file transfer tool\n"
       << "\n"
       << "Usage: stor <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  classify <path>...          Print the kind and normalized form of each path\n"
       << "  walk <path>...              List files and empty directories under each path\n"
       << "  upload <src>... <dest>      Copy local files to a destination\n"
       << "  download <src>... <dest>    Copy object-store files to a local directory\n"
       << "  copy <src>... <dest>        Copy between any two backends\n"
       << "  rmtree <path>               Remove a file or directory tree\n"
       << "  size <value>                Parse a size such as 10M into bytes\n"
       << "  objname <path>...           Print the object key for a local file name\n"
       << "  help                        Show this help message\n"
       << "\n"
       << "Options:\n"
       << "  -c, --config <file>   YAML configuration file\n"
       << "  -w, --workers <n>     Worker threads per batch\n"
       << "  --json                Print batch results as JSON\n"
       << "  --windows             Interpret local paths with the Windows convention\n"
       << "  -v, --verbose         Debug logging\n"
       << "\n"
       << "Exit status: 0 success, 1 error, 2 some items failed\n";
  out_.flush();
}

}  // namespace cli
}  // namespace stor

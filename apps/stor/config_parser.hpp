// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_CLI_CONFIG_PARSER_HPP
#define STOR_CLI_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace stor {
namespace logging {
struct LoggingConfig;
}
namespace transfer {
struct TransferOptions;
}
}  // namespace stor

namespace stor {
namespace cli {

struct LoggingSection {
  std::string level = "info";  // applies to console and file unless overridden
  bool console_enabled = true;
  bool console_colors = true;
  bool file_enabled = false;
  std::string file_dir = "/var/log/stor";
  std::string format = "json";  // "json" or "text"
};

struct TransferSection {
  size_t workers = 4;
  int64_t retry_interval_ms = 1000;
  int retry_max_attempts = 5;
  int item_retries = 3;
  size_t log_every_n = 100;
  int64_t log_interval_ms = 5000;
  bool verify_visibility = true;
};

struct S3Section {
  std::string endpoint_url;
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;
  std::string access_key;
  std::string secret_key;
  uint64_t part_size = 64 * 1024 * 1024;
  int executor_thread_count = 4;
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;
};

struct StorConfig {
  LoggingSection logging;
  TransferSection transfer;
  S3Section s3;
};

/**
 * Convert the logging section to stor::logging::LoggingConfig.
 * Unknown level strings keep the library defaults.
 */
void convert_logging_config(const LoggingSection& section, logging::LoggingConfig& log_config);

/**
 * Apply the transfer section to engine options.
 */
void convert_transfer_options(
  const TransferSection& section, transfer::TransferOptions& options
);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file. Keys not present keep their defaults.
   */
  bool load_from_file(const std::string& path, StorConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, StorConfig& config);

  /**
   * Validate ranges
   */
  static bool validate(const StorConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_logging(const YAML::Node& node, LoggingSection& logging);
  bool parse_transfer(const YAML::Node& node, TransferSection& transfer);
  bool parse_s3(const YAML::Node& node, S3Section& s3);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace stor

#endif  // STOR_CLI_CONFIG_PARSER_HPP

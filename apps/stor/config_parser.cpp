// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

#include "path_utils.hpp"
#include "stor_errors.hpp"
#include "stor_log_init.hpp"
#include "transfer_engine.hpp"

#define STOR_LOG_COMPONENT "config_parser"
#include <stor_log_macros.hpp>

namespace stor {
namespace cli {

bool ConfigParser::load_from_file(const std::string& path, StorConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, StorConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    if (node["transfer"] && !parse_transfer(node["transfer"], config.transfer)) {
      return false;
    }
    if (node["s3"] && !parse_s3(node["s3"], config.s3)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSection& logging) {
  if (node["level"]) {
    logging.level = node["level"].as<std::string>();
  }
  if (node["console_enabled"]) {
    logging.console_enabled = node["console_enabled"].as<bool>();
  }
  if (node["console_colors"]) {
    logging.console_colors = node["console_colors"].as<bool>();
  }
  if (node["file_enabled"]) {
    logging.file_enabled = node["file_enabled"].as<bool>();
  }
  if (node["file_dir"]) {
    logging.file_dir = node["file_dir"].as<std::string>();
  }
  if (node["format"]) {
    logging.format = node["format"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, TransferSection& transfer) {
  if (node["workers"]) {
    transfer.workers = node["workers"].as<size_t>();
  }
  if (node["retry_interval_ms"]) {
    transfer.retry_interval_ms = node["retry_interval_ms"].as<int64_t>();
  }
  if (node["retry_max_attempts"]) {
    transfer.retry_max_attempts = node["retry_max_attempts"].as<int>();
  }
  if (node["item_retries"]) {
    transfer.item_retries = node["item_retries"].as<int>();
  }
  if (node["log_every_n"]) {
    transfer.log_every_n = node["log_every_n"].as<size_t>();
  }
  if (node["log_interval_ms"]) {
    transfer.log_interval_ms = node["log_interval_ms"].as<int64_t>();
  }
  if (node["verify_visibility"]) {
    transfer.verify_visibility = node["verify_visibility"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_s3(const YAML::Node& node, S3Section& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["part_size"]) {
    // Plain byte count or a K/M/G suffixed string
    try {
      s3.part_size = parse_byte_size(node["part_size"].as<std::string>());
    } catch (const InvalidSize& e) {
      last_error_ = "Invalid s3.part_size: " + std::string(e.what());
      return false;
    }
  }
  if (node["executor_thread_count"]) {
    s3.executor_thread_count = node["executor_thread_count"].as<int>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  return true;
}

bool ConfigParser::validate(const StorConfig& config, std::string& error_msg) {
  if (config.transfer.workers == 0) {
    error_msg = "transfer.workers must be > 0";
    return false;
  }
  if (config.transfer.retry_interval_ms < 0) {
    error_msg = "transfer.retry_interval_ms must be >= 0";
    return false;
  }
  if (config.transfer.retry_max_attempts < 1) {
    error_msg = "transfer.retry_max_attempts must be >= 1";
    return false;
  }
  if (config.transfer.item_retries < 0) {
    error_msg = "transfer.item_retries must be >= 0";
    return false;
  }
  if (config.transfer.log_every_n == 0) {
    error_msg = "transfer.log_every_n must be > 0";
    return false;
  }
  if (!logging::parse_severity_level(config.logging.level)) {
    error_msg = "Unknown logging.level '" + config.logging.level + "'";
    return false;
  }
  if (config.logging.format != "json" && config.logging.format != "text") {
    error_msg = "logging.format must be 'json' or 'text'";
    return false;
  }
  if (config.s3.executor_thread_count < 1) {
    error_msg = "s3.executor_thread_count must be >= 1";
    return false;
  }
  return true;
}

void convert_logging_config(const LoggingSection& section, logging::LoggingConfig& log_config) {
  log_config.console_enabled = section.console_enabled;
  log_config.console_colors = section.console_colors;
  if (auto level = logging::parse_severity_level(section.level)) {
    log_config.console_level = *level;
    log_config.file_level = *level;
  }

  log_config.file_enabled = section.file_enabled;
  log_config.file_config.directory = section.file_dir;
  log_config.file_config.format_json = (section.format == "json");
}

void convert_transfer_options(
  const TransferSection& section, transfer::TransferOptions& options
) {
  options.worker_count = section.workers;
  options.retry_interval = std::chrono::milliseconds(section.retry_interval_ms);
  options.retry_max_attempts = section.retry_max_attempts;
  options.item_retries = section.item_retries;
  options.verify_visibility = section.verify_visibility;
  options.progress.log_every_n = section.log_every_n;
  options.progress.log_interval = std::chrono::milliseconds(section.log_interval_ms);

  STOR_LOG_DEBUG(
    "Transfer options" << logging::kv("workers", options.worker_count)
                       << logging::kv("item_retries", options.item_retries)
  );
}

}  // namespace cli
}  // namespace stor

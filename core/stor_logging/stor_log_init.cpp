// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stor_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <utility>
#include <vector>

#include "stor_log_macros.hpp"

namespace stor {
namespace logging {

namespace {

/**
 * Sinks owned by init_logging() plus any added through add_sink().
 * Guarded by mutex.
 */
struct LoggingState {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  std::vector<boost::shared_ptr<boost::log::sinks::sink>> attached;

  void attach(const boost::shared_ptr<boost::log::sinks::sink>& sink) {
    boost::log::core::get()->add_sink(sink);
    attached.push_back(sink);
  }
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<std::string> env_value(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// Unrecognized strings keep the current value
bool env_flag(const char* name, bool current) {
  auto value = env_value(name);
  if (!value) {
    return current;
  }
  const std::string v = lowercase(*value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    return false;
  }
  return current;
}

void env_level(const char* name, severity_level& target) {
  if (auto value = env_value(name)) {
    if (auto level = parse_severity_level(*value)) {
      target = *level;
    }
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> names[] = {
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warn", severity_level::warn},
    {"warning", severity_level::warn},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal},
  };

  const std::string lower = lowercase(level_str);
  for (const auto& entry : names) {
    if (lower == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // Global level first so the per-sink variables win
  if (auto value = env_value("STOR_LOG_LEVEL")) {
    if (auto level = parse_severity_level(*value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  env_level("STOR_LOG_CONSOLE_LEVEL", config.console_level);
  env_level("STOR_LOG_FILE_LEVEL", config.file_level);

  config.console_enabled = env_flag("STOR_LOG_CONSOLE_ENABLED", config.console_enabled);
  config.file_enabled = env_flag("STOR_LOG_FILE_ENABLED", config.file_enabled);

  if (auto dir = env_value("STOR_LOG_FILE_DIR")) {
    config.file_config.directory = *dir;
  }
  if (auto format = env_value("STOR_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(*format) == "json";
  }
}

logger_type& get_logger() {
  static logger_type logger;
  return logger;
}

void init_logging(const LoggingConfig& config) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.initialized) {
    return;
  }

  // TimeStamp, ThreadID, ...
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    s.console = create_console_sink(config.console_level, config.console_colors);
    s.attach(s.console);
  }
  if (config.file_enabled) {
    s.file = create_file_sink(config.file_config, config.file_level);
    s.attach(s.file);
  }
  s.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    return;
  }

  // Stopping drains the async queues
  if (s.console) {
    s.console->stop();
    s.console->flush();
  }
  if (s.file) {
    s.file->stop();
    s.file->flush();
  }

  auto core = boost::log::core::get();
  for (const auto& sink : s.attached) {
    core->remove_sink(sink);
  }
  s.attached.clear();
  s.console.reset();
  s.file.reset();
  s.initialized = false;
}

void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  s.attach(sink);
}

void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  boost::log::core::get()->remove_sink(sink);
  s.attached.erase(std::remove(s.attached.begin(), s.attached.end(), sink), s.attached.end());
}

void flush_logging() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.console) {
    s.console->flush();
  }
  if (s.file) {
    s.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

}  // namespace logging
}  // namespace stor

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_LOG_INIT_HPP
#define STOR_LOG_INIT_HPP

#include <boost/log/sinks/sink.hpp>

#include <optional>
#include <string>

#include "stor_console_sink.hpp"
#include "stor_file_sink.hpp"
#include "stor_log_severity.hpp"

namespace stor {
namespace logging {

/**
 * Sink selection and thresholds. Built from the `logging` section of the
 * YAML config, then adjusted by apply_env_overrides().
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

// Case-insensitive; "warning" is accepted as an alias of "warn"
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Environment overrides, applied on top of the YAML values:
 *
 *   STOR_LOG_LEVEL                        both sinks
 *   STOR_LOG_CONSOLE_LEVEL / _FILE_LEVEL  one sink, wins over STOR_LOG_LEVEL
 *   STOR_LOG_CONSOLE_ENABLED / _FILE_ENABLED
 *   STOR_LOG_FILE_DIR
 *   STOR_LOG_FORMAT                       json | text
 *
 * Empty or unparsable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

// No-op when already initialized; use reconfigure_logging() to change sinks
void init_logging(const LoggingConfig& config);

void init_logging_default();

// Drains the async queues before detaching; safe to call more than once
void shutdown_logging();

// Extra sinks are detached by shutdown_logging() along with the built-in ones
void add_sink(boost::shared_ptr<boost::log::sinks::sink> sink);
void remove_sink(boost::shared_ptr<boost::log::sinks::sink> sink);

void flush_logging();

/**
 * Replace the running sinks. Used by the CLI once the config file is read;
 * environment overrides are applied to @p config first.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace stor

#endif  // STOR_LOG_INIT_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_FILE_SINK_HPP
#define STOR_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "stor_log_severity.hpp"

namespace stor {
namespace logging {

/**
 * Async file sink with bounded queue.
 * Uses a larger queue than the console sink for slower I/O.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/var/log/stor";
  std::string file_pattern = "stor_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;  // Rotate at 100MB
  bool rotate_at_midnight = true;   // Also rotate daily
  int max_files = 10;               // Keep 10 rotated files
  bool format_json = true;          // JSON lines for log aggregation
};

/**
 * Escape a string for a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * Create async file sink with size and time based rotation.
 * Falls back to /tmp when the configured directory cannot be created.
 *
 * @param config File sink configuration
 * @param min_level Minimum severity level to log
 * @return Shared pointer to the sink
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace stor

#endif  // STOR_FILE_SINK_HPP

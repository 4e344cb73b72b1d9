// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_CONSOLE_SINK_HPP
#define STOR_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "stor_log_severity.hpp"

namespace stor {
namespace logging {

// Bounded at 1000 records; overflow is dropped rather than stalling a worker
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Sink on std::clog. Lines look like
 *   [2026-01-02 10:00:00.123456] [INFO] message | batch=.. backend=..
 * with the level tag coloured when @p use_colors is set.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

}  // namespace logging
}  // namespace stor

#endif  // STOR_CONSOLE_SINK_HPP

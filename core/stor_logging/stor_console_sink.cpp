// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stor_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>
#include <string>

namespace stor {
namespace logging {

namespace {

constexpr const char* kReset = "\033[0m";

// Indexed by severity_level: cyan, green, yellow, red, magenta
constexpr const char* kLevelColors[] = {
  "\033[36m",
  "\033[32m",
  "\033[33m",
  "\033[31m",
  "\033[35m",
};

const char* level_color(severity_level level) {
  const auto index = static_cast<size_t>(level);
  if (index < sizeof(kLevelColors) / sizeof(kLevelColors[0])) {
    return kLevelColors[index];
  }
  return "";
}

/**
 * [time] [LEVEL] message | batch=.. backend=..
 */
class ConsoleFormatter {
public:
  explicit ConsoleFormatter(bool use_colors)
      : use_colors_(use_colors) {}

  void operator()(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) const {
    auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    strm << "[";
    if (ts) {
      strm << *ts;
    }
    strm << "] ";

    if (auto level = boost::log::extract<severity_level>("Severity", rec)) {
      if (use_colors_) {
        strm << level_color(*level) << "[" << *level << "]" << kReset << " ";
      } else {
        strm << "[" << *level << "] ";
      }
    }

    strm << rec[boost::log::expressions::smessage];
    write_context(rec, strm);
  }

private:
  static void write_context(
    boost::log::record_view const& rec, boost::log::formatting_ostream& strm
  ) {
    auto batch = boost::log::extract<std::string>("BatchID", rec);
    auto backend = boost::log::extract<std::string>("Backend", rec);
    if (!batch && !backend) {
      return;
    }
    strm << " |";
    if (batch) {
      strm << " batch=" << *batch;
    }
    if (backend) {
      strm << " backend=" << *backend;
    }
  }

  bool use_colors_;
};

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  // std::clog is not owned by the sink
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(ConsoleFormatter(use_colors));
  return sink;
}

}  // namespace logging
}  // namespace stor

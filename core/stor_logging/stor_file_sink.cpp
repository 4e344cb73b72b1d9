// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stor_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace stor {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

const char* short_escape(unsigned char c) {
  switch (c) {
    case '"':
      return "\\\"";
    case '\\':
      return "\\\\";
    case '\b':
      return "\\b";
    case '\f':
      return "\\f";
    case '\n':
      return "\\n";
    case '\r':
      return "\\r";
    case '\t':
      return "\\t";
    default:
      return nullptr;
  }
}

/**
 * Attributes every file record may carry. Missing ones stay empty.
 */
struct RecordFields {
  boost::log::value_ref<boost::posix_time::ptime> time_stamp;
  boost::log::value_ref<severity_level> severity;
  boost::log::value_ref<boost::log::attributes::current_thread_id::value_type> thread_id;
  boost::log::value_ref<std::string> batch_id;
  boost::log::value_ref<std::string> backend;

  explicit RecordFields(boost::log::record_view const& rec)
      : time_stamp(boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec))
      , severity(boost::log::extract<severity_level>("Severity", rec))
      , thread_id(
          boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec)
        )
      , batch_id(boost::log::extract<std::string>("BatchID", rec))
      , backend(boost::log::extract<std::string>("Backend", rec)) {}
};

void write_json_string(
  boost::log::formatting_ostream& strm, const char* name, const std::string& value
) {
  strm << ",\"" << name << "\":\"" << escape_json(value) << "\"";
}

// One JSON object per line:
// {"ts":..,"level":..,"msg":..[,"thread_id":..][,"batch_id":..][,"backend":..]}
void json_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  RecordFields fields(rec);

  strm << "{\"ts\":\"";
  if (fields.time_stamp) {
    strm << *fields.time_stamp;
  }
  strm << "\",\"level\":\"";
  if (fields.severity) {
    strm << *fields.severity;
  }
  strm << "\"";

  write_json_string(strm, "msg", rec[expr::smessage].get());
  if (fields.thread_id) {
    strm << ",\"thread_id\":\"" << *fields.thread_id << "\"";
  }
  if (fields.batch_id) {
    write_json_string(strm, "batch_id", *fields.batch_id);
  }
  if (fields.backend) {
    write_json_string(strm, "backend", *fields.backend);
  }
  strm << "}";
}

// [ts] [LEVEL] message | batch=.. backend=..
void text_formatter(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  RecordFields fields(rec);

  strm << "[";
  if (fields.time_stamp) {
    strm << *fields.time_stamp;
  }
  strm << "] ";
  if (fields.severity) {
    strm << "[" << *fields.severity << "] ";
  }
  strm << rec[expr::smessage];

  if (fields.batch_id || fields.backend) {
    strm << " |";
    if (fields.batch_id) {
      strm << " batch=" << *fields.batch_id;
    }
    if (fields.backend) {
      strm << " backend=" << *fields.backend;
    }
  }
}

/**
 * Directory the sink writes to: the configured one, created if needed, or
 * the system temp directory when it cannot be created.
 */
std::string resolve_log_directory(const std::string& configured) {
  boost::system::error_code ec;
  if (boost::filesystem::is_directory(configured, ec)) {
    return configured;
  }
  boost::filesystem::create_directories(configured, ec);
  if (!ec) {
    return configured;
  }

  std::string fallback = boost::filesystem::temp_directory_path(ec).string();
  if (ec || fallback.empty()) {
    fallback = "/tmp";
  }
  // Logging is not up yet, so report on stderr
  std::cerr << "[stor_logging] Warning: Could not create log directory '" << configured
            << "', writing to " << fallback << "\n";
  return fallback;
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 16);
  for (unsigned char c : s) {
    if (const char* esc = short_escape(c)) {
      out += esc;
    } else if (c < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", c);
      out += buf;
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(
    sinks::file::make_collector(keywords::target = directory, keywords::max_files = config.max_files)
  );
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(config.format_json ? &json_formatter : &text_formatter);
  return sink;
}

}  // namespace logging
}  // namespace stor

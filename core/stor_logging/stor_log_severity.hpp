// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_LOG_SEVERITY_HPP
#define STOR_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>

namespace stor {
namespace logging {

// Ordered; filters compare with >=
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return nullptr;
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  if (const char* name = severity_name(level)) {
    return strm << name;
  }
  return strm << static_cast<int>(level);
}

// Boost.Log keyword for severity filtering
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

}  // namespace logging
}  // namespace stor

#endif  // STOR_LOG_SEVERITY_HPP

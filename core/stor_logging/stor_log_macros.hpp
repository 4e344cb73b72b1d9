// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_LOG_MACROS_HPP
#define STOR_LOG_MACROS_HPP

#include <boost/log/attributes/attribute_set.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/unique_identifier_name.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#include "stor_log_severity.hpp"

namespace stor {
namespace logging {

// Global severity logger type
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in stor_log_init.cpp
 */
logger_type& get_logger();

/**
 * Simple key-value formatter for structured logging.
 * Usage: STOR_LOG_INFO("message" << kv("key", value));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted
template<>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

/**
 * Attaches BatchID and Backend to every record the current thread emits
 * while the object is alive. An attribute the thread already carries is left
 * untouched and is not removed on destruction.
 */
class ScopedLogContext {
public:
  ScopedLogContext(const std::string& batch_id, const std::string& backend)
      : batch_id_(attach("BatchID", batch_id))
      , backend_(attach("Backend", backend)) {}

  ~ScopedLogContext() {
    detach(backend_);
    detach(batch_id_);
  }

  ScopedLogContext(const ScopedLogContext&) = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
  typedef std::pair<boost::log::attribute_set::iterator, bool> slot_type;

  static slot_type attach(const char* name, const std::string& value) {
    return boost::log::core::get()->add_thread_attribute(
      name, boost::log::attributes::constant<std::string>(value)
    );
  }

  static void detach(const slot_type& slot) {
    if (slot.second) {
      boost::log::core::get()->remove_thread_attribute(slot.first);
    }
  }

  slot_type batch_id_;
  slot_type backend_;
};

}  // namespace logging
}  // namespace stor

// =============================================================================
// Component identification
// Define STOR_LOG_COMPONENT before including this header to set component name.
//
//   #define STOR_LOG_COMPONENT "tree_walker"
//   #include <stor_log_macros.hpp>
// =============================================================================
#ifndef STOR_LOG_COMPONENT
#define STOR_LOG_COMPONENT "stor"
#endif

// DEBUG logs are compiled out in release builds
#ifdef NDEBUG
#define STOR_LOG_ENABLE_DEBUG 0
#else
#define STOR_LOG_ENABLE_DEBUG 1
#endif

// =============================================================================
// Main logging macros - stream-based API
// Usage: STOR_LOG_INFO("message" << kv("key", value));
// =============================================================================

#define STOR_LOG_DEBUG(msg) \
  do { \
    if (STOR_LOG_ENABLE_DEBUG) { \
      BOOST_LOG_SEV(::stor::logging::get_logger(), ::stor::logging::severity_level::debug) \
        << "[" << STOR_LOG_COMPONENT << "] " << msg; \
    } \
  } while (0)

#define STOR_LOG_INFO(msg) \
  do { \
    BOOST_LOG_SEV(::stor::logging::get_logger(), ::stor::logging::severity_level::info) \
      << "[" << STOR_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define STOR_LOG_WARN(msg) \
  do { \
    BOOST_LOG_SEV(::stor::logging::get_logger(), ::stor::logging::severity_level::warn) \
      << "[" << STOR_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define STOR_LOG_ERROR(msg) \
  do { \
    BOOST_LOG_SEV(::stor::logging::get_logger(), ::stor::logging::severity_level::error) \
      << "[" << STOR_LOG_COMPONENT << "] " << msg; \
  } while (0)

#define STOR_LOG_FATAL(msg) \
  do { \
    BOOST_LOG_SEV(::stor::logging::get_logger(), ::stor::logging::severity_level::fatal) \
      << "[" << STOR_LOG_COMPONENT << "] " << msg; \
  } while (0)

// =============================================================================
// Context management using scoped attributes
// Usage: STOR_LOG_SCOPED_CONTEXT("upload-1", "s3");
// Context is cleared when the scope exits
// =============================================================================
#define STOR_LOG_SCOPED_CONTEXT(batch_id_val, backend_val) \
  ::stor::logging::ScopedLogContext BOOST_LOG_UNIQUE_IDENTIFIER_NAME(_stor_log_context_)( \
    batch_id_val, backend_val \
  )

// =============================================================================
// Count-based sampling: log every Nth occurrence at a given call site.
// Usage: STOR_LOG_DEBUG_EVERY_N(1000, "Walked entries" << kv("count", i));
// =============================================================================

#define STOR_LOG_DEBUG_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _stor_log_counter{0}; \
    if ((++_stor_log_counter % (n)) == 1) { \
      STOR_LOG_DEBUG(msg); \
    } \
  } while (0)

#define STOR_LOG_INFO_EVERY_N(n, msg) \
  do { \
    static std::atomic<uint64_t> _stor_log_counter{0}; \
    if ((++_stor_log_counter % (n)) == 1) { \
      STOR_LOG_INFO(msg); \
    } \
  } while (0)

// =============================================================================
// Time-based throttling: log at most once per interval (in seconds).
// Usage: STOR_LOG_WARN_THROTTLE(5.0, "Backend slow" << kv("key", key));
// =============================================================================

#define STOR_LOG_WARN_THROTTLE(interval_sec, msg) \
  do { \
    static std::chrono::steady_clock::time_point _stor_last_log_time{}; \
    static std::mutex _stor_throttle_mutex; \
    auto _stor_now = std::chrono::steady_clock::now(); \
    bool _stor_should_log = false; \
    { \
      std::lock_guard<std::mutex> _stor_lock(_stor_throttle_mutex); \
      if (_stor_now - _stor_last_log_time >= std::chrono::duration<double>(interval_sec)) { \
        _stor_last_log_time = _stor_now; \
        _stor_should_log = true; \
      } \
    } \
    if (_stor_should_log) { \
      STOR_LOG_WARN(msg); \
    } \
  } while (0)

#endif  // STOR_LOG_MACROS_HPP

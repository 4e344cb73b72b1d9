// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_ERRORS_HPP
#define STOR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace stor {

/**
 * Base class for all errors raised by stor.
 */
class StorError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * A path that must exist (e.g. a walk root) does not exist on its backend.
 */
class PathNotFound : public StorError {
public:
  explicit PathNotFound(const std::string& path)
      : StorError("Path not found: " + path)
      , path_(path) {}

  const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
};

/**
 * A retry condition is not callable or its attempt budget is unusable.
 */
class InvalidCondition : public StorError {
public:
  using StorError::StorError;
};

/**
 * A byte-size string could not be parsed.
 */
class InvalidSize : public StorError {
public:
  explicit InvalidSize(const std::string& input)
      : StorError("Invalid size: '" + input + "'")
      , input_(input) {}

  const std::string& input() const {
    return input_;
  }

private:
  std::string input_;
};

/**
 * A directory was requested where a regular file exists (EEXIST), or a parent
 * component of the requested directory is a regular file (ENOTDIR).
 */
class DirectoryConflict : public StorError {
public:
  DirectoryConflict(const std::string& path, int code, const std::string& message)
      : StorError(message + ": " + path)
      , path_(path)
      , code_(code) {}

  const std::string& path() const {
    return path_;
  }

  /// errno-style code (EEXIST or ENOTDIR)
  int code() const {
    return code_;
  }

private:
  std::string path_;
  int code_;
};

/**
 * A backend call failed. Carries the manifest key or path that triggered it.
 */
class BackendError : public StorError {
public:
  BackendError(
    const std::string& key, const std::string& message, const std::string& code = "",
    bool retryable = false
  )
      : StorError(message + " (" + key + ")")
      , key_(key)
      , detail_(message)
      , code_(code)
      , retryable_(retryable) {}

  const std::string& key() const {
    return key_;
  }

  const std::string& detail() const {
    return detail_;
  }

  const std::string& code() const {
    return code_;
  }

  /// True for transient errors (throttling, timeouts, connection resets)
  bool retryable() const {
    return retryable_;
  }

private:
  std::string key_;
  std::string detail_;
  std::string code_;
  bool retryable_;
};

/**
 * No backend client is registered for a path kind.
 */
class BackendUnavailable : public StorError {
public:
  using StorError::StorError;
};

}  // namespace stor

#endif  // STOR_ERRORS_HPP

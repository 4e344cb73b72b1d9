// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_PATH_HPP
#define STOR_PATH_HPP

#include <optional>
#include <ostream>
#include <string>

namespace stor {

/**
 * Backend variant of a path. The set is closed; operations switch on it.
 */
enum class PathKind { posix, windows, swift, s3 };

/**
 * Filesystem convention used to decide whether a string is a Windows path.
 */
enum class PathConvention { posix, windows };

constexpr const char* SWIFT_PREFIX = "swift://";
constexpr const char* S3_PREFIX = "s3://";

/**
 * Convention of the platform this binary was built for.
 */
PathConvention host_convention();

const char* to_string(PathKind kind);
std::ostream& operator<<(std::ostream& os, PathKind kind);

/**
 * Location of an object-store path.
 *
 * Swift: swift://tenant/container/resource
 * S3:    s3://bucket/key (bucket reported as container, tenant empty)
 */
struct ObjectLocation {
  std::string tenant;
  std::string container;
  std::string resource;
};

/**
 * Immutable path value tagged with its backend variant.
 *
 * The kind is derived once at construction and preserved by every
 * manipulation (join, parent). Two paths are equal iff kind and normalized
 * string match.
 *
 * Normalization collapses repeated separators and removes trailing separators
 * except on a bare root ("/", "C:\", "s3://", "swift://"). Windows paths use
 * '\' and accept '/' on input. "." and ".." segments are kept as given.
 */
class Path {
public:
  /**
   * Classify and normalize a raw string.
   */
  explicit Path(const std::string& raw, PathConvention convention = host_convention());

  PathKind kind() const {
    return kind_;
  }

  const std::string& str() const {
    return path_;
  }

  bool is_object_store() const;
  bool is_filesystem() const;

  /// '\' for windows paths, '/' otherwise
  char separator() const;

  /**
   * Append one or more components. The child uses the receiver's separator
   * conventions and the result keeps the receiver's kind.
   */
  Path join(const std::string& child) const;
  Path operator/(const std::string& child) const {
    return join(child);
  }

  /**
   * Path with the last component removed. Roots are their own parent; a
   * relative single-component filesystem path has parent ".".
   */
  Path parent() const;

  /**
   * Last component, or "" for a root.
   */
  std::string name() const;

  bool is_absolute() const;

  /// True for "/", "C:\", "\\", "s3://", "swift://"
  bool is_root() const;

  /**
   * '/'-separated remainder of this path below base, "" if equal.
   * std::nullopt when base has a different kind or is not a prefix.
   */
  std::optional<std::string> relative_to(const Path& base) const;

  /**
   * Tenant/container/resource split of an object-store path.
   * @throws std::invalid_argument for filesystem paths
   */
  ObjectLocation object_location() const;

  bool operator==(const Path& other) const {
    return kind_ == other.kind_ && path_ == other.path_;
  }
  bool operator!=(const Path& other) const {
    return !(*this == other);
  }
  bool operator<(const Path& other) const {
    if (kind_ != other.kind_) {
      return kind_ < other.kind_;
    }
    return path_ < other.path_;
  }

private:
  Path(PathKind kind, const std::string& raw);

  static std::string normalize(PathKind kind, const std::string& raw);

  // Length of the root prefix ("/", "C:\", "\\", "s3://"), 0 if relative
  size_t root_length() const;

  PathKind kind_;
  std::string path_;
};

std::ostream& operator<<(std::ostream& os, const Path& path);

/**
 * Determine the backend variant of a raw string. First match wins:
 *   1. "swift://" prefix           -> swift
 *   2. "s3://" prefix              -> s3
 *   3. Windows convention and an absolute drive-letter or UNC path -> windows
 *   4. anything else               -> posix
 *
 * Malformed prefixes such as "swift:/x" fall through to the filesystem kinds.
 * Never throws.
 */
PathKind classify_kind(const std::string& raw, PathConvention convention = host_convention());

/**
 * Build a typed path value from a raw string.
 */
Path classify(const std::string& raw, PathConvention convention = host_convention());

bool is_swift_path(const std::string& raw);
bool is_s3_path(const std::string& raw);

/// Swift or S3
bool is_obs_path(const std::string& raw);

bool is_filesystem_path(const std::string& raw);

}  // namespace stor

#endif  // STOR_PATH_HPP

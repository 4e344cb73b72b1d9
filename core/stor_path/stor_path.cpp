// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stor_path.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace stor {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
  return s.compare(0, std::strlen(prefix), prefix) == 0;
}

bool is_windows_absolute(const std::string& raw) {
  if (raw.size() >= 3 && std::isalpha(static_cast<unsigned char>(raw[0])) && raw[1] == ':' &&
      (raw[2] == '\\' || raw[2] == '/')) {
    return true;
  }
  // UNC: \\server\share
  return raw.size() >= 2 && raw[0] == '\\' && raw[1] == '\\';
}

const char* scheme_prefix(PathKind kind) {
  switch (kind) {
    case PathKind::swift:
      return SWIFT_PREFIX;
    case PathKind::s3:
      return S3_PREFIX;
    case PathKind::posix:
    case PathKind::windows:
      break;
  }
  return "";
}

std::string collapse(const std::string& body, char sep) {
  std::string out;
  out.reserve(body.size());
  for (char c : body) {
    if (c == sep && !out.empty() && out.back() == sep) {
      continue;
    }
    out += c;
  }
  return out;
}

}  // namespace

PathConvention host_convention() {
#ifdef _WIN32
  return PathConvention::windows;
#else
  return PathConvention::posix;
#endif
}

const char* to_string(PathKind kind) {
  switch (kind) {
    case PathKind::posix:
      return "posix";
    case PathKind::windows:
      return "windows";
    case PathKind::swift:
      return "swift";
    case PathKind::s3:
      return "s3";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, PathKind kind) {
  return os << to_string(kind);
}

PathKind classify_kind(const std::string& raw, PathConvention convention) {
  if (starts_with(raw, SWIFT_PREFIX)) {
    return PathKind::swift;
  }
  if (starts_with(raw, S3_PREFIX)) {
    return PathKind::s3;
  }
  if (convention == PathConvention::windows && is_windows_absolute(raw)) {
    return PathKind::windows;
  }
  return PathKind::posix;
}

Path classify(const std::string& raw, PathConvention convention) {
  return Path(raw, convention);
}

bool is_swift_path(const std::string& raw) {
  return starts_with(raw, SWIFT_PREFIX);
}

bool is_s3_path(const std::string& raw) {
  return starts_with(raw, S3_PREFIX);
}

bool is_obs_path(const std::string& raw) {
  return is_swift_path(raw) || is_s3_path(raw);
}

bool is_filesystem_path(const std::string& raw) {
  return !is_obs_path(raw);
}

// =============================================================================
// Path
// =============================================================================

Path::Path(const std::string& raw, PathConvention convention)
    : Path(classify_kind(raw, convention), raw) {}

Path::Path(PathKind kind, const std::string& raw)
    : kind_(kind)
    , path_(normalize(kind, raw)) {}

std::string Path::normalize(PathKind kind, const std::string& raw) {
  switch (kind) {
    case PathKind::swift:
    case PathKind::s3: {
      const std::string prefix = scheme_prefix(kind);
      std::string rest = collapse(raw.substr(prefix.size()), '/');
      while (!rest.empty() && rest.front() == '/') {
        rest.erase(0, 1);
      }
      while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
      }
      return prefix + rest;
    }
    case PathKind::posix: {
      if (raw.empty()) {
        return ".";
      }
      std::string out = collapse(raw, '/');
      while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
      }
      return out;
    }
    case PathKind::windows: {
      std::string converted = raw;
      for (auto& c : converted) {
        if (c == '/') {
          c = '\\';
        }
      }
      // Keep the UNC double backslash, collapse everything after it
      std::string lead;
      if (converted.compare(0, 2, "\\\\") == 0) {
        lead = "\\\\";
        converted.erase(0, 2);
      }
      std::string out = lead + collapse(converted, '\\');
      if (out.empty()) {
        return ".";
      }
      // Strip trailing separators but keep "C:\" and "\"
      while (out.size() > 1 && out.back() == '\\') {
        if (out.size() == 3 && out[1] == ':') {
          break;
        }
        if (out == lead) {
          break;
        }
        out.pop_back();
      }
      return out;
    }
  }
  return raw;
}

bool Path::is_object_store() const {
  return kind_ == PathKind::swift || kind_ == PathKind::s3;
}

bool Path::is_filesystem() const {
  return !is_object_store();
}

char Path::separator() const {
  return kind_ == PathKind::windows ? '\\' : '/';
}

size_t Path::root_length() const {
  switch (kind_) {
    case PathKind::swift:
    case PathKind::s3:
      return std::strlen(scheme_prefix(kind_));
    case PathKind::posix:
      return (!path_.empty() && path_[0] == '/') ? 1 : 0;
    case PathKind::windows:
      if (path_.size() >= 3 && path_[1] == ':' && path_[2] == '\\') {
        return 3;
      }
      if (path_.compare(0, 2, "\\\\") == 0) {
        return 2;
      }
      if (!path_.empty() && path_[0] == '\\') {
        return 1;
      }
      return 0;
  }
  return 0;
}

bool Path::is_absolute() const {
  return root_length() > 0;
}

bool Path::is_root() const {
  size_t root = root_length();
  return root > 0 && root == path_.size();
}

Path Path::join(const std::string& child) const {
  if (child.empty()) {
    return *this;
  }
  std::string combined;
  if (is_root()) {
    combined = path_ + child;
  } else if (is_filesystem() && path_ == ".") {
    combined = child;
  } else {
    combined = path_ + separator() + child;
  }
  return Path(kind_, combined);
}

Path Path::parent() const {
  if (is_root()) {
    return *this;
  }
  const size_t root = root_length();
  const char sep = separator();
  size_t pos = path_.rfind(sep);

  if (pos == std::string::npos || pos + 1 <= root) {
    // No separator past the root: parent is the root itself, or "." if relative
    if (root > 0) {
      return Path(kind_, path_.substr(0, root));
    }
    return Path(kind_, ".");
  }
  return Path(kind_, path_.substr(0, pos));
}

std::string Path::name() const {
  if (is_root()) {
    return "";
  }
  const size_t root = root_length();
  size_t pos = path_.rfind(separator());
  if (pos == std::string::npos || pos + 1 <= root) {
    return path_.substr(root);
  }
  return path_.substr(pos + 1);
}

std::optional<std::string> Path::relative_to(const Path& base) const {
  if (kind_ != base.kind_) {
    return std::nullopt;
  }
  if (path_ == base.path_) {
    return std::string();
  }

  std::string prefix = base.path_;
  if (base.is_filesystem() && base.path_ == ".") {
    if (is_absolute()) {
      return std::nullopt;
    }
    prefix.clear();
  } else if (!base.is_root()) {
    prefix += separator();
  }
  if (path_.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  std::string rest = path_.substr(prefix.size());
  if (kind_ == PathKind::windows) {
    for (auto& c : rest) {
      if (c == '\\') {
        c = '/';
      }
    }
  }
  return rest;
}

ObjectLocation Path::object_location() const {
  if (!is_object_store()) {
    throw std::invalid_argument("Not an object store path: " + path_);
  }

  std::string rest = path_.substr(root_length());
  auto take = [&rest]() {
    size_t pos = rest.find('/');
    std::string head = rest.substr(0, pos);
    rest = (pos == std::string::npos) ? std::string() : rest.substr(pos + 1);
    return head;
  };

  ObjectLocation location;
  if (kind_ == PathKind::swift) {
    location.tenant = take();
  }
  location.container = take();
  location.resource = rest;
  return location;
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
  return os << path.str();
}

}  // namespace stor

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "path_utils.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <vector>

#include "stor_errors.hpp"

namespace stor {

uint64_t parse_byte_size(uint64_t size) {
  return size;
}

uint64_t parse_byte_size(const std::string& size) {
  size_t digits = 0;
  while (digits < size.size() && std::isdigit(static_cast<unsigned char>(size[digits]))) {
    ++digits;
  }
  if (digits == 0 || size.size() - digits > 1) {
    throw InvalidSize(size);
  }

  uint64_t multiplier = 1;
  if (digits < size.size()) {
    switch (std::toupper(static_cast<unsigned char>(size[digits]))) {
      case 'K':
        multiplier = KIB;
        break;
      case 'M':
        multiplier = MIB;
        break;
      case 'G':
        multiplier = GIB;
        break;
      default:
        throw InvalidSize(size);
    }
  }

  uint64_t value = 0;
  for (size_t i = 0; i < digits; ++i) {
    uint64_t digit = static_cast<uint64_t>(size[i] - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      throw InvalidSize(size);
    }
    value = value * 10 + digit;
  }
  if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
    throw InvalidSize(size);
  }
  return value * multiplier;
}

std::string expand_environment(const std::string& path) {
  std::string out;
  size_t i = 0;

  if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/' || path[1] == '\\')) {
    const char* home = std::getenv("HOME");
    if (home != nullptr) {
      out = home;
      i = 1;
    }
  }

  while (i < path.size()) {
    if (path[i] != '$') {
      out += path[i++];
      continue;
    }

    size_t start = i + 1;
    size_t end = start;
    bool braced = start < path.size() && path[start] == '{';
    if (braced) {
      end = path.find('}', start + 1);
      if (end == std::string::npos) {
        out += path.substr(i);
        break;
      }
      std::string name = path.substr(start + 1, end - start - 1);
      const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
      out += value != nullptr ? std::string(value) : path.substr(i, end + 1 - i);
      i = end + 1;
      continue;
    }

    while (end < path.size() &&
           (std::isalnum(static_cast<unsigned char>(path[end])) || path[end] == '_')) {
      ++end;
    }
    if (end == start) {
      out += path[i++];
      continue;
    }
    std::string name = path.substr(start, end - start);
    const char* value = std::getenv(name.c_str());
    out += value != nullptr ? std::string(value) : path.substr(i, end - i);
    i = end;
  }
  return out;
}

std::string file_name_to_object_name(const std::string& path, PathConvention convention) {
  std::string expanded = expand_environment(path);

  if (convention == PathConvention::windows) {
    if (expanded.size() >= 2 && std::isalpha(static_cast<unsigned char>(expanded[0])) &&
        expanded[1] == ':') {
      expanded.erase(0, 2);
    }
    for (auto& c : expanded) {
      if (c == '\\') {
        c = '/';
      }
    }
  }

  // ".." above the root of an absolute path is dropped; on a relative
  // path it is kept so distinct inputs keep distinct keys
  const bool absolute = !expanded.empty() && expanded[0] == '/';
  std::vector<std::string> segments;
  size_t pos = 0;
  while (pos <= expanded.size()) {
    size_t next = expanded.find('/', pos);
    if (next == std::string::npos) {
      next = expanded.size();
    }
    std::string segment = expanded.substr(pos, next - pos);
    if (segment == "..") {
      if (!segments.empty() && segments.back() != "..") {
        segments.pop_back();
      } else if (!absolute) {
        segments.push_back(segment);
      }
    } else if (!segment.empty() && segment != ".") {
      segments.push_back(segment);
    }
    pos = next + 1;
  }

  std::string name;
  for (const auto& segment : segments) {
    if (!name.empty()) {
      name += '/';
    }
    name += segment;
  }
  return name;
}

bool has_trailing_separator(const std::optional<std::string>& path) {
  return path.has_value() && !path->empty() && path->back() == '/';
}

std::optional<std::string> remove_trailing_separator(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return std::nullopt;
  }
  std::string out = *path;
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

std::string with_trailing_separator(const std::string& path) {
  if (has_trailing_separator(path)) {
    return path;
  }
  return path + '/';
}

}  // namespace stor

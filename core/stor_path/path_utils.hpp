// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_PATH_UTILS_HPP
#define STOR_PATH_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "stor_path.hpp"

namespace stor {

constexpr uint64_t KIB = 1024ULL;
constexpr uint64_t MIB = 1024ULL * KIB;
constexpr uint64_t GIB = 1024ULL * MIB;

/**
 * Integer sizes pass through unchanged.
 */
uint64_t parse_byte_size(uint64_t size);

/**
 * Parse a human-readable byte size: digits with an optional K/M/G suffix
 * (case-insensitive, powers of 1024). "64M" -> 67108864.
 *
 * @throws InvalidSize if the input is empty, has no digits, has an unknown
 *         suffix or overflows
 */
uint64_t parse_byte_size(const std::string& size);

/**
 * Convert a local file name into an object key.
 *
 * Expands $VAR, ${VAR} and a leading ~, drops a drive letter, converts '\'
 * to '/' under the Windows convention, resolves "." and ".." segments,
 * collapses repeated separators and strips leading and trailing '/'.
 *
 *   "/abs/path/"          -> "abs/path"
 *   ".//poor//path//file" -> "poor/path/file"
 *   "."                   -> ""
 */
std::string file_name_to_object_name(
  const std::string& path, PathConvention convention = host_convention()
);

/**
 * Expand $VAR, ${VAR} and a leading ~ from the environment. Unset variables
 * are left as written.
 */
std::string expand_environment(const std::string& path);

bool has_trailing_separator(const std::optional<std::string>& path);

/**
 * Strip every trailing '/'. An absent value stays absent.
 */
std::optional<std::string> remove_trailing_separator(const std::optional<std::string>& path);

std::string with_trailing_separator(const std::string& path);

}  // namespace stor

#endif  // STOR_PATH_UTILS_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_S3_CLIENT_TEST_HELPERS_HPP
#define STOR_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal helpers of s3_client.cpp

#include <cstdint>
#include <string>

namespace stor {
namespace s3 {

/**
 * Convert AWS TransferStatus to error code string
 * @param status Transfer status enum value as int
 */
std::string transferStatusToErrorCode(int status);

/**
 * Strip a trailing '/' from a custom endpoint URL
 */
std::string normalizeEndpoint(const std::string& endpoint);

/**
 * Clamp a multipart part size to S3's [5MB, 5GB] range
 */
uint64_t clampPartSize(uint64_t part_size);

}  // namespace s3
}  // namespace stor

#endif  // STOR_S3_CLIENT_TEST_HELPERS_HPP

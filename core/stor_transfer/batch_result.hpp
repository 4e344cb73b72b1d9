// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_BATCH_RESULT_HPP
#define STOR_BATCH_RESULT_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "stor_errors.hpp"

namespace stor {
namespace transfer {

/**
 * Summary of one batch operation
 */
struct BatchResult {
  size_t succeeded = 0;
  uint64_t bytes = 0;
  std::vector<std::pair<std::string, std::string>> failed;  // (key, error)

  bool ok() const {
    return failed.empty();
  }

  size_t total() const {
    return succeeded + failed.size();
  }
};

/**
 * Raised when a batch was asked to fail loudly and at least one item failed.
 * Carries the full result so callers can report or retry the failed keys.
 */
class PartialBatchFailure : public StorError {
public:
  explicit PartialBatchFailure(BatchResult result)
      : StorError(
          std::to_string(result.failed.size()) + " of " + std::to_string(result.total()) +
          " items failed"
        )
      , result_(std::move(result)) {}

  const BatchResult& result() const {
    return result_;
  }

private:
  BatchResult result_;
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_BATCH_RESULT_HPP

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_TRANSFER_ENGINE_HPP
#define STOR_TRANSFER_ENGINE_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "backend_client.hpp"
#include "batch_result.hpp"
#include "progress_logger.hpp"
#include "retry_handler.hpp"
#include "tree_walker.hpp"

namespace stor {
namespace transfer {

enum class TransferDirection { upload, download, copy };

const char* to_string(TransferDirection direction);

/**
 * Tuning for batch operations
 */
struct TransferOptions {
  // Visibility polling for eventually consistent destinations
  std::chrono::milliseconds retry_interval{1000};
  int retry_max_attempts = 5;
  bool verify_visibility = true;

  size_t worker_count = 4;

  // Re-queues per item for retryable backend errors; overrides retry.max_retries
  int item_retries = 3;
  RetryConfig retry;

  // Throw PartialBatchFailure instead of returning a result with failures
  bool raise_on_failure = false;

  ProgressLoggerOptions progress;

  // Log context for every record emitted by the workers
  std::string batch_id = "batch";
};

using LoggerFactory = std::function<std::unique_ptr<ProgressLogger>(size_t total)>;

/**
 * Factory for the progress logger matching a direction. Copies use the
 * upload logger.
 */
LoggerFactory default_logger_factory(
  TransferDirection direction, const ProgressLoggerOptions& options = {}
);

/**
 * Copy every manifest entry to destination_root / key.
 *
 * Items are processed by options.worker_count threads. Placeholder entries
 * create an empty directory at the destination. Each item produces exactly
 * one result in the progress logger; the returned BatchResult aggregates
 * them.
 *
 * @param logger_factory Empty: default_logger_factory(direction)
 * @throws std::invalid_argument if an upload has a non-local source or a
 *         download has a non-local destination
 * @throws BackendUnavailable if a needed client is not registered
 * @throws PartialBatchFailure if options.raise_on_failure and any item failed
 */
BatchResult run_batch_transfer(
  const Manifest& manifest, const Path& destination_root, TransferDirection direction,
  const BackendRegistry& registry, LoggerFactory logger_factory = {},
  const TransferOptions& options = {}
);

/**
 * Delete root and everything below it. Files are removed in parallel, then
 * directories deepest first.
 *
 * @throws PathNotFound if root does not exist
 * @throws PartialBatchFailure if options.raise_on_failure and any item failed
 */
BatchResult remove_tree(
  const Path& root, const BackendRegistry& registry, LoggerFactory logger_factory = {},
  const TransferOptions& options = {}
);

}  // namespace transfer
}  // namespace stor

#endif  // STOR_TRANSFER_ENGINE_HPP

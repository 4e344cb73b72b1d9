// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_engine.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "condition_retrier.hpp"
#include "local_filesystem.hpp"
#include "stor_errors.hpp"
#include "transfer_queue.hpp"

#define STOR_LOG_COMPONENT "transfer_engine"
#include <stor_log_macros.hpp>

namespace stor {
namespace transfer {

using logging::kv;

namespace {

/**
 * Counters shared by the workers of one batch
 */
struct BatchCounters {
  std::atomic<size_t> succeeded{0};
  std::atomic<uint64_t> bytes{0};
};

using ItemAction = std::function<uint64_t(const TransferItem&)>;

void wait_for_visibility(
  IBackendClient& client, const TransferItem& item, const TransferOptions& options
) {
  ConditionRetrier retrier(ConditionRetryConfig{options.retry_interval, options.retry_max_attempts});
  bool visible = retrier.wait_until([&client, &item]() {
    return client.exists(item.destination);
  });
  if (!visible) {
    throw BackendError(
      item.entry.key,
      "Destination not visible after " + std::to_string(retrier.attempts()) + " attempts",
      "NotVisible"
    );
  }
}

uint64_t transfer_item(
  const TransferItem& item, IBackendClient& source_client, IBackendClient& dest_client,
  const TransferOptions& options
) {
  const Path& source = item.entry.source;
  const Path& dest = item.destination;
  uint64_t bytes = 0;

  if (item.entry.directory) {
    if (dest.is_filesystem()) {
      make_dest_dir(dest.str());
    } else {
      dest_client.make_directory(dest);
    }
  } else if (source.is_filesystem()) {
    std::ifstream in(source.str(), std::ios::binary);
    if (!in.is_open()) {
      throw BackendError(item.entry.key, "Cannot open source file " + source.str(), "NoSuchKey");
    }
    bytes = dest_client.write_file(dest, in);
  } else if (dest.is_filesystem()) {
    make_dest_dir(dest.parent().str());
    std::ofstream out(dest.str(), std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw BackendError(item.entry.key, "Cannot open destination file " + dest.str(), "WriteError");
    }
    bytes = source_client.read_file(source, out);
    out.close();
    if (out.fail()) {
      throw BackendError(item.entry.key, "Failed to flush " + dest.str(), "WriteError");
    }
  } else {
    // Object to object: no shared stream between backends
    std::stringstream buffer;
    source_client.read_file(source, buffer);
    buffer.seekg(0);
    bytes = dest_client.write_file(dest, buffer);
  }

  if (options.verify_visibility && dest_client.eventually_consistent()) {
    wait_for_visibility(dest_client, item, options);
  }
  return bytes;
}

/**
 * Drain items through worker_count threads. Retryable backend errors are
 * re-queued with backoff; everything else resolves the item.
 */
void run_workers(
  std::vector<TransferItem> items, const ItemAction& action, ProgressLogger& logger,
  BatchCounters& counters, const TransferOptions& options, const std::string& backend
) {
  if (items.empty()) {
    return;
  }

  RetryConfig retry_config = options.retry;
  retry_config.max_retries = options.item_retries;
  RetryHandler retry(retry_config);

  TransferQueue queue;
  for (auto& item : items) {
    queue.enqueue(std::move(item));
  }

  auto worker = [&]() {
    STOR_LOG_SCOPED_CONTEXT(options.batch_id, backend);

    while (auto item = queue.dequeue()) {
      const std::string key = item->entry.key;
      try {
        uint64_t bytes = action(*item);
        counters.succeeded++;
        counters.bytes += bytes;
        logger.add_result(ProgressResult::Success(key, bytes));
        queue.resolve();
      } catch (const BackendError& e) {
        if (e.retryable() && retry.should_retry(item->retry_count)) {
          STOR_LOG_WARN_THROTTLE(
            5.0, "Retrying item" << kv("key", key) << kv("retry", item->retry_count + 1)
                                 << kv("error", e.what())
          );
          item->next_retry_at = retry.next_attempt_at(item->retry_count);
          item->retry_count++;
          if (!queue.requeue_for_retry(std::move(*item))) {
            logger.add_result(ProgressResult::Failure(key, e.what()));
            queue.resolve();
          }
          continue;
        }
        STOR_LOG_DEBUG("Item failed" << kv("key", key) << kv("error", e.what()));
        logger.add_result(ProgressResult::Failure(key, e.what()));
        queue.resolve();
      } catch (const std::exception& e) {
        STOR_LOG_DEBUG("Item failed" << kv("key", key) << kv("error", e.what()));
        logger.add_result(ProgressResult::Failure(key, e.what()));
        queue.resolve();
      }
    }
  };

  size_t worker_count = std::max<size_t>(1, std::min(options.worker_count, items.size()));
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& t : workers) {
    t.join();
  }
}

BatchResult finish_batch(
  ProgressLogger& logger, const BatchCounters& counters, const TransferOptions& options
) {
  BatchResult result;
  result.succeeded = counters.succeeded.load();
  result.bytes = counters.bytes.load();
  for (const auto& failure : logger.close()) {
    result.failed.emplace_back(failure.key, failure.error);
  }

  if (!result.ok()) {
    STOR_LOG_WARN(
      "Batch completed with failures" << kv("batch_id", options.batch_id)
                                      << kv("succeeded", result.succeeded)
                                      << kv("failed", result.failed.size())
    );
    if (options.raise_on_failure) {
      throw PartialBatchFailure(result);
    }
  }
  return result;
}

std::unique_ptr<ProgressLogger> make_logger(
  const LoggerFactory& factory, TransferDirection direction, const TransferOptions& options,
  size_t total
) {
  auto logger = factory ? factory(total) : default_logger_factory(direction, options.progress)(total);
  if (!logger) {
    throw std::invalid_argument("Logger factory returned no logger");
  }
  return logger;
}

size_t depth(const Path& path) {
  return static_cast<size_t>(std::count(path.str().begin(), path.str().end(), path.separator()));
}

}  // namespace

const char* to_string(TransferDirection direction) {
  switch (direction) {
    case TransferDirection::upload:
      return "upload";
    case TransferDirection::download:
      return "download";
    case TransferDirection::copy:
      return "copy";
  }
  return "unknown";
}

LoggerFactory default_logger_factory(
  TransferDirection direction, const ProgressLoggerOptions& options
) {
  return [direction, options](size_t total) -> std::unique_ptr<ProgressLogger> {
    if (direction == TransferDirection::download) {
      return std::make_unique<DownloadProgressLogger>(total, options);
    }
    return std::make_unique<UploadProgressLogger>(total, options);
  };
}

BatchResult run_batch_transfer(
  const Manifest& manifest, const Path& destination_root, TransferDirection direction,
  const BackendRegistry& registry, LoggerFactory logger_factory, const TransferOptions& options
) {
  if (direction == TransferDirection::upload) {
    for (const auto& entry : manifest) {
      if (!entry.source.is_filesystem()) {
        throw std::invalid_argument("Upload source is not a local path: " + entry.source.str());
      }
    }
  }
  if (direction == TransferDirection::download && !destination_root.is_filesystem()) {
    throw std::invalid_argument(
      "Download destination is not a local path: " + destination_root.str()
    );
  }

  auto dest_client = registry.client_for(destination_root);
  if (options.verify_visibility && dest_client->eventually_consistent() &&
      options.retry_max_attempts < 1) {
    throw InvalidCondition("retry_max_attempts must be at least 1");
  }

  // Resolve every source client up front so a missing backend fails the
  // whole batch before any item is attempted
  std::map<PathKind, std::shared_ptr<IBackendClient>> source_clients;
  std::vector<TransferItem> items;
  items.reserve(manifest.size());
  for (const auto& entry : manifest) {
    auto kind = entry.source.kind();
    if (source_clients.find(kind) == source_clients.end()) {
      source_clients[kind] = registry.client_for(kind);
    }
    items.emplace_back(entry, destination_root / entry.key);
  }

  STOR_LOG_INFO(
    "Starting batch transfer" << kv("direction", to_string(direction))
                              << kv("items", manifest.size())
                              << kv("destination", destination_root.str())
                              << kv("workers", options.worker_count)
  );

  auto logger = make_logger(logger_factory, direction, options, manifest.size());
  BatchCounters counters;

  ItemAction action = [&](const TransferItem& item) {
    return transfer_item(
      item, *source_clients.at(item.entry.source.kind()), *dest_client, options
    );
  };
  run_workers(std::move(items), action, *logger, counters, options, dest_client->name());

  BatchResult result = finish_batch(*logger, counters, options);
  STOR_LOG_INFO(
    "Batch transfer complete" << kv("direction", to_string(direction))
                              << kv("succeeded", result.succeeded)
                              << kv("failed", result.failed.size()) << kv("bytes", result.bytes)
  );
  return result;
}

BatchResult remove_tree(
  const Path& root, const BackendRegistry& registry, LoggerFactory logger_factory,
  const TransferOptions& options
) {
  auto client = registry.client_for(root);
  Manifest manifest = walk_files_and_dirs({root}, registry);

  // Every directory from each entry up to and including root
  std::vector<TransferItem> files;
  std::set<Path> directories;
  const bool root_is_dir = client->is_directory(root);
  for (const auto& entry : manifest) {
    if (entry.directory) {
      directories.insert(entry.source);
    } else {
      files.emplace_back(entry, entry.source);
    }
    if (!root_is_dir) {
      continue;
    }
    Path dir = entry.directory ? entry.source : entry.source.parent();
    while (dir != root && dir.relative_to(root)) {
      directories.insert(dir);
      dir = dir.parent();
    }
  }
  if (root_is_dir) {
    directories.insert(root);
  }

  const size_t total = files.size() + directories.size();
  std::unique_ptr<ProgressLogger> logger;
  if (logger_factory) {
    logger = logger_factory(total);
  } else {
    logger = std::make_unique<DeleteProgressLogger>(total, options.progress);
  }
  if (!logger) {
    throw std::invalid_argument("Logger factory returned no logger");
  }

  STOR_LOG_INFO(
    "Removing tree" << kv("root", root.str()) << kv("files", files.size())
                    << kv("directories", directories.size())
  );

  BatchCounters counters;
  ItemAction remove_file = [&client](const TransferItem& item) -> uint64_t {
    client->remove_file(item.entry.source);
    return 0;
  };
  run_workers(std::move(files), remove_file, *logger, counters, options, client->name());

  // Children before parents
  std::vector<Path> ordered(directories.begin(), directories.end());
  std::stable_sort(ordered.begin(), ordered.end(), [](const Path& a, const Path& b) {
    return depth(a) > depth(b);
  });
  for (const auto& dir : ordered) {
    const std::string key = dir.relative_to(root.parent()).value_or(dir.str());
    try {
      client->remove_directory(dir);
      counters.succeeded++;
      logger->add_result(ProgressResult::Success(key));
    } catch (const std::exception& e) {
      logger->add_result(ProgressResult::Failure(key, e.what()));
    }
  }

  return finish_batch(*logger, counters, options);
}

}  // namespace transfer
}  // namespace stor

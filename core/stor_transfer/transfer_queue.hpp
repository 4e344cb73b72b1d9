// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STOR_TRANSFER_QUEUE_HPP
#define STOR_TRANSFER_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "stor_path.hpp"
#include "tree_walker.hpp"

namespace stor {
namespace transfer {

/**
 * One manifest entry bound to its destination
 */
struct TransferItem {
  ManifestEntry entry;
  Path destination;
  int retry_count = 0;
  std::chrono::steady_clock::time_point next_retry_at;

  TransferItem(ManifestEntry e, Path dest)
      : entry(std::move(e))
      , destination(std::move(dest)) {}
};

/**
 * Min-heap ordering by next_retry_at
 */
struct RetryItemComparator {
  bool operator()(const TransferItem& a, const TransferItem& b) const {
    return a.next_retry_at > b.next_retry_at;
  }
};

/**
 * Work queue shared by the transfer workers.
 *
 * Items re-queued for retry wait in a priority queue until their
 * next_retry_at. The queue tracks outstanding items (enqueued but not yet
 * resolved) and shuts itself down when the last one is resolved, which
 * releases every worker blocked in dequeue().
 */
class TransferQueue {
public:
  TransferQueue() = default;
  ~TransferQueue();

  TransferQueue(const TransferQueue&) = delete;
  TransferQueue& operator=(const TransferQueue&) = delete;
  TransferQueue(TransferQueue&&) = delete;
  TransferQueue& operator=(TransferQueue&&) = delete;

  /**
   * Add a new item. Counts as outstanding until resolve() is called for it.
   * @return false after shutdown
   */
  bool enqueue(TransferItem item);

  /**
   * Block until an item is ready or the queue shuts down.
   * @return std::nullopt on shutdown
   */
  std::optional<TransferItem> dequeue();

  /**
   * Put a dequeued item back; it becomes available at next_retry_at.
   * The item stays outstanding.
   */
  bool requeue_for_retry(TransferItem item);

  /**
   * Mark a dequeued item as finished (success or final failure).
   */
  void resolve();

  /**
   * Refuse further items and release every blocked dequeue().
   */
  void shutdown();

private:
  // Caller holds mutex_
  void promote_due_retries(std::chrono::steady_clock::time_point now);

  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<TransferItem> main_queue_;
  std::priority_queue<TransferItem, std::vector<TransferItem>, RetryItemComparator> retry_queue_;
  size_t outstanding_ = 0;
  bool shutdown_ = false;
};

}  // namespace transfer
}  // namespace stor

#endif  // STOR_TRANSFER_QUEUE_HPP

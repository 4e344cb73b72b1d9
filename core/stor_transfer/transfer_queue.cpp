// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_queue.hpp"

namespace stor {
namespace transfer {

using Clock = std::chrono::steady_clock;

TransferQueue::~TransferQueue() {
  shutdown();
}

bool TransferQueue::enqueue(TransferItem item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return false;
    }
    main_queue_.push(std::move(item));
    ++outstanding_;
  }
  cv_.notify_one();
  return true;
}

std::optional<TransferItem> TransferQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (shutdown_) {
      return std::nullopt;
    }

    promote_due_retries(Clock::now());
    if (!main_queue_.empty()) {
      std::optional<TransferItem> item(std::move(main_queue_.front()));
      main_queue_.pop();
      return item;
    }

    // Sleep until the earliest pending retry is due, or until woken
    if (retry_queue_.empty()) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, retry_queue_.top().next_retry_at);
    }
  }
}

bool TransferQueue::requeue_for_retry(TransferItem item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      return false;
    }
    // Already due: skip the heap
    if (item.next_retry_at > Clock::now()) {
      retry_queue_.push(std::move(item));
    } else {
      main_queue_.push(std::move(item));
    }
  }
  cv_.notify_one();
  return true;
}

void TransferQueue::resolve() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (outstanding_ > 0) {
    --outstanding_;
  }
  if (outstanding_ != 0 || !main_queue_.empty() || !retry_queue_.empty()) {
    return;
  }
  lock.unlock();
  shutdown();
}

void TransferQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void TransferQueue::promote_due_retries(Clock::time_point now) {
  while (!retry_queue_.empty() && retry_queue_.top().next_retry_at <= now) {
    // top() is const, so the item is copied out
    main_queue_.push(retry_queue_.top());
    retry_queue_.pop();
  }
}

}  // namespace transfer
}  // namespace stor

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace optguard {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
//
// @brief  MPMC FIFO between whichever thread made a decision and the
//         IpcServer worker that publishes it.
//
// @details
// capacity == 0 means unbounded. With a capacity, push() into a full queue
// evicts the oldest element. dropped() counts evictions since construction.
//
// pop() blocks; try_pop() and drain() never block.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Returns false when an older element had to be evicted.
  bool push(T value) {
    bool evicted = false;
    {
      std::lock_guard lock(mutex_);
      if (capacity_ != 0 && items_.size() >= capacity_) {
        items_.pop_front();
        ++dropped_;
        evicted = true;
      }
      items_.push_back(std::move(value));
    }
    ready_.notify_one();
    return !evicted;
  }

  T pop() {
    std::unique_lock lock(mutex_);
    ready_.wait(lock, [this] { return !items_.empty(); });
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  // Everything queued right now, oldest first, in one lock acquisition.
  std::vector<T> drain() {
    std::vector<T> out;
    std::lock_guard lock(mutex_);
    out.reserve(items_.size());
    for (auto& item : items_) {
      out.push_back(std::move(item));
    }
    items_.clear();
    return out;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return items_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  std::size_t dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
  }

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<T> items_;
  std::size_t dropped_{0};
};

}  // namespace optguard

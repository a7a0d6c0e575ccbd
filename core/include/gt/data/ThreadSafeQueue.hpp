#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace gt {

// Bounded multi-producer queue shared between the receive thread and the
// tick thread. A full queue evicts its oldest entry.
template <typename T>
class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(std::size_t capacity = 256)
      : capacity_(capacity > 0 ? capacity : 1) {}

  // Returns false if an older entry was evicted to make room.
  bool push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    bool evicted = items_.size() >= capacity_;
    if (evicted) {
      items_.pop_front();
      ++evicted_;
    }
    items_.push_back(std::move(item));
    return !evicted;
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  // Moves every queued entry into out (appended, oldest first) under a
  // single lock. Returns the number moved.
  std::size_t drain(std::vector<T>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = items_.size();
    for (auto& item : items_) out.push_back(std::move(item));
    items_.clear();
    return n;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
  }

  std::size_t capacity() const { return capacity_; }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return evicted_;
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> items_;
  const std::size_t capacity_;
  std::size_t evicted_{0};
};

} // namespace gt

#pragma once
#include <cstdint>
#include <memory>
#include <mutex>

namespace gt {

// Single-writer swap pointer. Readers always get a fully committed
// snapshot that stays valid for as long as they hold it.
template <typename T>
class SnapshotPublisher {
public:
  void publish(std::shared_ptr<const T> snapshot) {
    std::lock_guard<std::mutex> lock(mtx_);
    current_ = std::move(snapshot);
    ++version_;
  }

  std::shared_ptr<const T> latest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return version_;
  }

private:
  mutable std::mutex mtx_;
  std::shared_ptr<const T> current_;
  std::uint64_t version_{0};
};

} // namespace gt

#pragma once
#include "gt/data/MessageSource.hpp"
#include "gt/data/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace gt {

// In-process source: a producer (replay reader, test) pushes envelopes
// and drives the connection status by hand.
class QueueMessageSource : public MessageSource {
public:
  explicit QueueMessageSource(std::size_t maxQueueSize = 64)
      : inbound_(maxQueueSize), sent_(maxQueueSize) {}

  void start() override;
  void stop() override;
  bool poll(std::string& message) override { return inbound_.pop(message); }
  bool send(const std::string& message) override;
  bool isRunning() const override { return running_.load(); }
  ConnectionStatus status() const override { return status_.load(); }

  // Producer side.
  bool push(const std::string& message) { return inbound_.push(message); }
  void setStatus(ConnectionStatus s) { status_.store(s); }
  std::size_t pending() const { return inbound_.size(); }

  // Envelopes handed to send(), oldest first.
  bool takeSent(std::string& message) { return sent_.pop(message); }

private:
  ThreadSafeQueue<std::string> inbound_;
  ThreadSafeQueue<std::string> sent_;
  std::atomic<bool> running_{false};
  std::atomic<ConnectionStatus> status_{ConnectionStatus::Disconnected};
};

} // namespace gt

#pragma once
#include "gt/data/MessageSource.hpp"
#include "gt/data/ThreadSafeQueue.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace gt {

struct WebSocketSourceConfig {
  std::string url{"ws://localhost:8765"};
  int reconnectIntervalMs{3000};  // auto-reconnect delay
  std::size_t maxQueueSize{64};   // max pending inbound messages
  std::size_t maxOutboundQueue{32};
};

// Connection manager: owns the socket on a background thread, reconnects
// on failure, and hands complete text messages to the tick loop.
class WebSocketMessageSource : public MessageSource {
public:
  explicit WebSocketMessageSource(const WebSocketSourceConfig& config);
  ~WebSocketMessageSource() override;

  void start() override;
  void stop() override;
  bool poll(std::string& message) override;
  bool send(const std::string& message) override;
  bool isRunning() const override;
  ConnectionStatus status() const override;

  std::size_t droppedMessages() const { return inbound_.dropped(); }

private:
  void receiveLoop();
  void waitForReconnect();

  WebSocketSourceConfig config_;
  ThreadSafeQueue<std::string> inbound_;
  ThreadSafeQueue<std::string> outbound_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<ConnectionStatus> status_{ConnectionStatus::Disconnected};
};

} // namespace gt

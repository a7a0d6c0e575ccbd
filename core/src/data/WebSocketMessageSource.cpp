#include "gt/data/WebSocketMessageSource.hpp"
#include <easywsclient/easywsclient.hpp>

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>
#include <vector>

namespace gt {

WebSocketMessageSource::WebSocketMessageSource(const WebSocketSourceConfig& config)
    : config_(config),
      inbound_(config.maxQueueSize),
      outbound_(config.maxOutboundQueue) {}

WebSocketMessageSource::~WebSocketMessageSource() { stop(); }

void WebSocketMessageSource::start() {
  if (running_.load()) return;
  running_.store(true);
  status_.store(ConnectionStatus::Connecting);
  thread_ = std::thread(&WebSocketMessageSource::receiveLoop, this);
}

void WebSocketMessageSource::stop() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
  status_.store(ConnectionStatus::Disconnected);
}

bool WebSocketMessageSource::poll(std::string& message) {
  return inbound_.pop(message);
}

bool WebSocketMessageSource::send(const std::string& message) {
  if (!running_.load()) return false;
  if (!outbound_.push(message)) {
    std::fprintf(stderr, "[WebSocketMessageSource] outbound queue full, dropped oldest\n");
  }
  return true;
}

bool WebSocketMessageSource::isRunning() const { return running_.load(); }

ConnectionStatus WebSocketMessageSource::status() const {
  return status_.load();
}

void WebSocketMessageSource::waitForReconnect() {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.reconnectIntervalMs);
  while (running_.load() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
}

void WebSocketMessageSource::receiveLoop() {
  while (running_.load()) {
    status_.store(ConnectionStatus::Connecting);
    std::fprintf(stderr, "[WebSocketMessageSource] connecting to %s\n",
                 config_.url.c_str());

    std::unique_ptr<easywsclient::WebSocket,
                    void (*)(easywsclient::WebSocket*)>
        ws(easywsclient::WebSocket::from_url(config_.url),
           [](easywsclient::WebSocket* p) {
             if (p && p != easywsclient::WebSocket::create_dummy()) delete p;
           });

    if (!ws || ws->getReadyState() == easywsclient::WebSocket::CLOSED) {
      std::fprintf(stderr,
                   "[WebSocketMessageSource] connection failed, retrying in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(ConnectionStatus::Error);
      waitForReconnect();
      continue;
    }

    status_.store(ConnectionStatus::Connected);
    std::fprintf(stderr, "[WebSocketMessageSource] connected\n");

    // Requests queued while offline are stale.
    outbound_.clear();
    std::vector<std::string> pending;

    while (running_.load() &&
           ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      pending.clear();
      outbound_.drain(pending);
      for (const auto& out : pending) ws->send(out);

      ws->poll(10);
      ws->dispatch([this](const std::string& msg) {
        if (!inbound_.push(msg)) {
          std::fprintf(stderr,
                       "[WebSocketMessageSource] inbound queue full, dropped oldest\n");
        }
      });
    }

    if (ws->getReadyState() != easywsclient::WebSocket::CLOSED) {
      ws->close();
      ws->poll(0);
    }

    if (running_.load()) {
      std::fprintf(stderr,
                   "[WebSocketMessageSource] disconnected, reconnecting in %dms\n",
                   config_.reconnectIntervalMs);
      status_.store(ConnectionStatus::Error);
      waitForReconnect();
    }
  }

  status_.store(ConnectionStatus::Disconnected);
}

} // namespace gt

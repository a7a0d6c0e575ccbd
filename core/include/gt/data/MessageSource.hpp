#pragma once
#include <cstdint>
#include <string>

namespace gt {

enum class ConnectionStatus : std::uint8_t { Disconnected, Connecting, Connected, Error };

const char* connectionStatusName(ConnectionStatus s);

// Channel of textual envelopes between the capture server and the tick
// loop. poll() never blocks.
class MessageSource {
public:
  virtual ~MessageSource() = default;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual bool poll(std::string& message) = 0;
  // Queues an outbound envelope; false if it cannot be delivered.
  virtual bool send(const std::string& message) = 0;
  virtual bool isRunning() const = 0;
  virtual ConnectionStatus status() const = 0;
};

} // namespace gt

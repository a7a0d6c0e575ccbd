#include "gt/data/QueueMessageSource.hpp"

namespace gt {

void QueueMessageSource::start() {
  running_.store(true);
  status_.store(ConnectionStatus::Connected);
}

void QueueMessageSource::stop() {
  running_.store(false);
  status_.store(ConnectionStatus::Disconnected);
}

bool QueueMessageSource::send(const std::string& message) {
  if (status_.load() != ConnectionStatus::Connected) return false;
  sent_.push(message);
  return true;
}

} // namespace gt

#include "gt/data/MessageSource.hpp"

namespace gt {

const char* connectionStatusName(ConnectionStatus s) {
  switch (s) {
    case ConnectionStatus::Disconnected: return "disconnected";
    case ConnectionStatus::Connecting:   return "connecting";
    case ConnectionStatus::Connected:    return "connected";
    case ConnectionStatus::Error:        return "error";
  }
  return "disconnected";
}

} // namespace gt

#include "gt/ErrorKind.hpp"

namespace gt {

const char* errorKindName(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:           return "none";
    case ErrorKind::CorruptPayload: return "corrupt_payload";
    case ErrorKind::StaleReference: return "stale_reference";
    case ErrorKind::LockDenied:     return "lock_denied";
    case ErrorKind::HandTimeout:    return "hand_timeout";
    case ErrorKind::BadMessage:     return "bad_message";
    case ErrorKind::BadConfig:      return "bad_config";
  }
  return "unknown";
}

} // namespace gt

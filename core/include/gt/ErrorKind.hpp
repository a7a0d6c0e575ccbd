#pragma once
#include <cstdint>

namespace gt {

// Recoverable failure classes. None of these stop the interaction loop.
enum class ErrorKind : std::uint8_t {
  None = 0,
  CorruptPayload,  // malformed, truncated or un-inflatable point-cloud body
  StaleReference,  // mutator called with an id no longer in the store
  LockDenied,      // arbitration conflict, normal control flow
  HandTimeout,     // hand unseen past its grace window
  BadMessage,      // inbound JSON envelope could not be parsed
  BadConfig        // configuration key of wrong type or out of range
};

const char* errorKindName(ErrorKind k);

} // namespace gt

#pragma once

#include <stdexcept>
#include <string>

namespace burrow {

/// Failure classes seen by the lifecycle loop. Fatal auth rejection is not
/// an error kind: the handshake reports it as an outcome.
enum class error_kind {
  connection, // channel establishment, read/write, timeout: retryable
  protocol,   // a relay message that does not decode
  forwarding, // local service call: becomes a response envelope
};

inline const char *to_string(error_kind kind) {
  switch (kind) {
  case error_kind::connection:
    return "connection";
  case error_kind::protocol:
    return "protocol";
  case error_kind::forwarding:
    return "forwarding";
  }
  return "unknown";
}

class tunnel_error : public std::runtime_error {
public:
  tunnel_error(error_kind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  error_kind kind() const { return kind_; }

private:
  error_kind kind_;
};

inline tunnel_error connection_error(const std::string &message) {
  return tunnel_error(error_kind::connection, message);
}

inline tunnel_error protocol_error(const std::string &message) {
  return tunnel_error(error_kind::protocol, message);
}

} // namespace burrow

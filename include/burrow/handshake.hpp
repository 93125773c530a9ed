#pragma once

#include "channel.hpp"
#include "error.hpp"
#include "protocol.hpp"

#include <chrono>
#include <string>
#include <variant>

namespace burrow {

/// Identity of an authenticated tunnel. Valid only for the channel that
/// produced it.
struct session_info {
  std::string agent_name;
  std::string service_code;
  std::string tunnel_url;
};

enum class handshake_outcome {
  accepted, // session established
  rejected, // explicit negative auth result: fatal
  failed,   // no usable reply: retry with a new connection
};

struct handshake_result {
  handshake_outcome outcome = handshake_outcome::failed;
  session_info session;
  std::string message;
};

/// Send `auth` and wait for exactly one reply. Never retries; never throws
/// for channel or protocol trouble, which map to handshake_outcome::failed.
inline handshake_result perform_handshake(channel &chan,
                                          const std::string &credential,
                                          std::chrono::milliseconds timeout) {
  handshake_result result;

  std::string text;
  try {
    chan.send_text(encode_outbound(auth_request{credential}));
    if (!chan.receive_text(text, timeout)) {
      result.message = "no auth reply within " +
                       std::to_string(timeout.count()) + " ms";
      return result;
    }
  } catch (const tunnel_error &e) {
    result.message = e.what();
    return result;
  }

  inbound_message reply;
  try {
    reply = decode_inbound(text);
  } catch (const tunnel_error &e) {
    result.message = e.what();
    return result;
  }

  if (auto *auth = std::get_if<auth_result>(&reply)) {
    if (!auth->ok) {
      result.outcome = handshake_outcome::rejected;
      result.message = auth->message;
      return result;
    }
    result.outcome = handshake_outcome::accepted;
    result.session = {auth->agent_name, auth->service_code, auth->tunnel_url};
    return result;
  }
  if (auto *err = std::get_if<relay_error>(&reply)) {
    // The relay reports bad credentials as a plain error before auth_ok.
    result.outcome = handshake_outcome::rejected;
    result.message = err->message;
    return result;
  }

  result.message = "unexpected reply to auth";
  return result;
}

} // namespace burrow

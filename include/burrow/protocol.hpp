#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <variant>

namespace burrow {

using header_map = std::map<std::string, std::string>;

/// Relay reply to `auth`.
struct auth_result {
  bool ok = false;
  std::string agent_name;
  std::string service_code;
  std::string tunnel_url;
  std::string message;
};

struct ping_message {};
struct pong_message {};

/// A request received by the relay, to be replayed against the local
/// service. `id` is assigned by the relay and echoed in the response.
struct request_envelope {
  std::string id;
  std::string method = "POST";
  std::string path = "/";
  std::string query_string;
  header_map headers;
  std::string body;
};

/// Error notice sent by the relay outside the handshake.
struct relay_error {
  std::string message;
};

struct unknown_message {
  std::string type;
};

using inbound_message = std::variant<auth_result, ping_message, pong_message,
                                     request_envelope, relay_error,
                                     unknown_message>;

struct auth_request {
  std::string credential;
};

struct response_envelope {
  std::string id;
  int status = 0;
  header_map headers;
  std::string body;
};

using outbound_message = std::variant<auth_request, ping_message, pong_message,
                                      response_envelope>;

namespace detail {

using json = nlohmann::json;

inline std::string string_field(const json &msg, const char *key,
                                const std::string &fallback = std::string()) {
  auto it = msg.find(key);
  if (it == msg.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

inline header_map header_field(const json &msg, const char *key) {
  header_map headers;
  auto it = msg.find(key);
  if (it == msg.end() || it->is_null()) {
    return headers;
  }
  if (!it->is_object()) {
    throw protocol_error(std::string("\"") + key + "\" is not an object");
  }
  for (auto field = it->begin(); field != it->end(); ++field) {
    headers[field.key()] = field.value().is_string()
                               ? field.value().get<std::string>()
                               : field.value().dump();
  }
  return headers;
}

struct encoder {
  json operator()(const auth_request &msg) const {
    return {{"type", "auth"}, {"api_key", msg.credential}};
  }
  json operator()(const ping_message &) const { return {{"type", "ping"}}; }
  json operator()(const pong_message &) const { return {{"type", "pong"}}; }
  json operator()(const response_envelope &msg) const {
    return {{"type", "response"},
            {"id", msg.id},
            {"status", msg.status},
            {"headers", msg.headers},
            {"body", msg.body}};
  }
};

} // namespace detail

/// Decode one relay message. Throws tunnel_error(protocol) when the text is
/// not a JSON object with a string "type", or a request lacks its id.
inline inbound_message decode_inbound(const std::string &text) {
  using detail::json;

  json msg;
  try {
    msg = json::parse(text);
  } catch (const json::parse_error &e) {
    throw protocol_error(std::string("malformed relay message: ") + e.what());
  }
  if (!msg.is_object()) {
    throw protocol_error("relay message is not an object");
  }
  auto type_it = msg.find("type");
  if (type_it == msg.end() || !type_it->is_string()) {
    throw protocol_error("relay message has no type");
  }
  const auto type = type_it->get<std::string>();

  if (type == "auth_ok") {
    auth_result result;
    result.ok = true;
    result.agent_name = detail::string_field(msg, "agent_name");
    result.service_code = detail::string_field(msg, "service_code");
    result.tunnel_url = detail::string_field(msg, "tunnel_url");
    result.message = detail::string_field(msg, "message");
    return result;
  }
  if (type == "auth_error" || type == "auth_failed") {
    auth_result result;
    result.message = detail::string_field(msg, "message", "unknown reason");
    return result;
  }
  if (type == "ping") {
    return ping_message{};
  }
  if (type == "pong") {
    return pong_message{};
  }
  if (type == "request") {
    auto id = msg.find("id");
    if (id == msg.end() || !id->is_string()) {
      throw protocol_error("request without id");
    }
    request_envelope req;
    req.id = id->get<std::string>();
    req.method = detail::string_field(msg, "method", "POST");
    req.path = detail::string_field(msg, "path", "/");
    req.query_string = detail::string_field(msg, "query_string");
    req.headers = detail::header_field(msg, "headers");
    req.body = detail::string_field(msg, "body");
    return req;
  }
  if (type == "error") {
    return relay_error{detail::string_field(msg, "message", "unknown error")};
  }
  return unknown_message{type};
}

/// Encode one client message. Invalid UTF-8 in bodies is replaced rather
/// than rejected.
inline std::string encode_outbound(const outbound_message &msg) {
  return std::visit(detail::encoder{}, msg)
      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace burrow

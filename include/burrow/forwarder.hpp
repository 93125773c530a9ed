#pragma once

#include "http_client.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace burrow {

/// Drop the headers that describe the relay's hop rather than the request.
inline header_map forwardable_headers(const header_map &headers) {
  header_map out;
  for (const auto &kv : headers) {
    if (iequals(kv.first, "host") || iequals(kv.first, "connection")) {
      continue;
    }
    out.emplace(kv.first, kv.second);
  }
  return out;
}

/// Build "<path>[?<query>]".
inline std::string request_target(const std::string &path,
                                  const std::string &query_string) {
  std::string target = path.empty() ? "/" : path;
  if (target.front() != '/') {
    target.insert(target.begin(), '/');
  }
  if (!query_string.empty()) {
    target += "?" + query_string;
  }
  return target;
}

inline response_envelope error_response(const std::string &id, int status,
                                        const std::string &message) {
  response_envelope resp;
  resp.id = id;
  resp.status = status;
  resp.headers["content-type"] = "application/json";
  resp.body = nlohmann::json{{"error", message}}.dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
  return resp;
}

/// Replays relay requests against the local service. forward() never
/// throws: every failure becomes a 5xx envelope with a JSON error body.
class request_forwarder {
public:
  request_forwarder(std::string host, int port,
                    std::chrono::milliseconds timeout)
      : client_(std::move(host), port, timeout) {}

  response_envelope forward(const request_envelope &req) const noexcept {
    try {
      http_request local;
      local.method = req.method.empty() ? "POST" : req.method;
      local.target = request_target(req.path, req.query_string);
      local.headers = forwardable_headers(req.headers);
      local.body = req.body;

      http_response reply = client_.send(local);

      response_envelope resp;
      resp.id = req.id;
      resp.status = reply.status;
      resp.headers = std::move(reply.headers);
      resp.body = std::move(reply.body);
      return resp;
    } catch (const http_error &e) {
      switch (e.failure()) {
      case http_failure::unreachable:
        return error_response(req.id, 502, "Cannot reach local service");
      case http_failure::timed_out:
        return error_response(req.id, 504, "Local service timed out");
      case http_failure::other:
        break;
      }
      return error_response(req.id, 500, e.what());
    } catch (const std::exception &e) {
      return error_response(req.id, 500, e.what());
    }
  }

private:
  http_client client_;
};

} // namespace burrow

#pragma once

#include "backoff.hpp"
#include "channel.hpp"
#include "error.hpp"
#include "forwarder.hpp"
#include "handshake.hpp"
#include "heartbeat.hpp"
#include "options.hpp"
#include "protocol.hpp"
#include "run_control.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace burrow {

enum class connection_state {
  disconnected,
  connecting,
  authenticating,
  ready,
  stopped,
};

inline const char *to_string(connection_state state) {
  switch (state) {
  case connection_state::disconnected:
    return "disconnected";
  case connection_state::connecting:
    return "connecting";
  case connection_state::authenticating:
    return "authenticating";
  case connection_state::ready:
    return "ready";
  case connection_state::stopped:
    return "stopped";
  }
  return "unknown";
}

enum class run_result {
  stopped,       // run_control was signaled
  auth_rejected, // the relay refused the credential
};

/// Owns the relay connection: connect, authenticate, serve requests, and
/// reconnect with backoff until stopped or rejected.
class tunnel_client {
public:
  using connector_fn = std::function<std::unique_ptr<channel>(
      const std::string &url, std::chrono::milliseconds timeout)>;
  using forward_fn =
      std::function<response_envelope(const request_envelope &)>;

  explicit tunnel_client(tunnel_options options)
      : tunnel_client(options, default_connector(),
                      default_forwarder(options)) {}

  tunnel_client(tunnel_options options, connector_fn connector,
                forward_fn forward)
      : options_(std::move(options)), connector_(std::move(connector)),
        forward_(std::move(forward)), reconnect_(options_.backoff) {
    if (!connector_ || !forward_) {
      throw std::invalid_argument("connector and forwarder are required");
    }
  }

  tunnel_client(const tunnel_client &) = delete;
  tunnel_client &operator=(const tunnel_client &) = delete;

  /// Blocks until `control` is stopped or authentication is rejected.
  run_result run(run_control &control) {
    for (;;) {
      if (control.stopped()) {
        set_state(connection_state::stopped);
        return run_result::stopped;
      }

      set_state(connection_state::connecting);
      spdlog::info("Connecting to {}...", options_.relay_url);
      std::unique_ptr<channel> chan;
      try {
        chan = connector_(options_.relay_url, options_.connect_timeout);
      } catch (const std::exception &e) {
        if (!control.stopped()) {
          spdlog::warn("Connection failed: {}", e.what());
        }
      }

      if (chan) {
        session_end end = serve(*chan, control);
        chan.reset();
        if (end == session_end::rejected) {
          set_state(connection_state::stopped);
          return run_result::auth_rejected;
        }
      }

      set_state(connection_state::disconnected);
      if (control.stopped()) {
        set_state(connection_state::stopped);
        return run_result::stopped;
      }

      auto delay = reconnect_.next_delay();
      reconnect_.record_failure();
      spdlog::info("Reconnecting in {}ms (attempt {})...", delay.count(),
                   reconnect_.attempt());
      if (control.wait_for(delay)) {
        set_state(connection_state::stopped);
        return run_result::stopped;
      }
    }
  }

  connection_state state() const { return state_.load(); }

  std::optional<session_info> session() const {
    std::lock_guard<std::mutex> lock(session_mu_);
    return session_;
  }

  /// Inspect only while run() is not executing.
  const reconnect_state &reconnect() const { return reconnect_; }

  static connector_fn default_connector() {
    return [](const std::string &url, std::chrono::milliseconds timeout) {
      return std::unique_ptr<channel>(ws_channel::connect(url, timeout));
    };
  }

  static forward_fn default_forwarder(const tunnel_options &options) {
    auto forwarder = std::make_shared<request_forwarder>(
        options.local_host, options.local_port, options.forward_timeout);
    return [forwarder](const request_envelope &req) {
      return forwarder->forward(req);
    };
  }

private:
  enum class session_end { lost, rejected };

  /// Clears the stop hook before the channel it points at goes away.
  class stop_hook_guard {
  public:
    stop_hook_guard(run_control &control, channel &chan) : control_(control) {
      control_.set_stop_hook([&chan]() { chan.interrupt(); });
    }
    ~stop_hook_guard() { control_.clear_stop_hook(); }

    stop_hook_guard(const stop_hook_guard &) = delete;
    stop_hook_guard &operator=(const stop_hook_guard &) = delete;

  private:
    run_control &control_;
  };

  session_end serve(channel &chan, run_control &control) {
    stop_hook_guard hook(control, chan);

    set_state(connection_state::authenticating);
    auto hs = perform_handshake(chan, options_.credential,
                                options_.handshake_timeout);
    switch (hs.outcome) {
    case handshake_outcome::rejected:
      spdlog::error("Auth failed: {}", hs.message);
      return session_end::rejected;
    case handshake_outcome::failed:
      if (!control.stopped()) {
        spdlog::warn("Handshake failed: {}", hs.message);
      }
      return session_end::lost;
    case handshake_outcome::accepted:
      break;
    }

    {
      std::lock_guard<std::mutex> lock(session_mu_);
      session_ = hs.session;
    }
    reconnect_.reset();
    spdlog::info("Authenticated as \"{}\" ({})", hs.session.agent_name,
                 hs.session.service_code);
    spdlog::info("Tunnel: {} -> {}:{}", hs.session.tunnel_url,
                 options_.local_host, options_.local_port);
    spdlog::info("Ready.");
    set_state(connection_state::ready);

    heartbeat_monitor heartbeat(options_.heartbeat_interval);
    heartbeat.start(chan);
    try {
      receive_loop(chan, control);
    } catch (const tunnel_error &e) {
      report(e, control);
    } catch (const std::exception &e) {
      spdlog::warn("Unexpected error: {}", e.what());
    }
    // A ping may be blocked on a dead socket; fail it before joining.
    chan.interrupt();
    heartbeat.stop();

    {
      std::lock_guard<std::mutex> lock(session_mu_);
      session_.reset();
    }
    return session_end::lost;
  }

  void receive_loop(channel &chan, run_control &control) {
    std::string text;
    while (!control.stopped()) {
      if (!chan.receive_text(text, options_.idle_timeout)) {
        throw connection_error("no traffic from relay for " +
                               std::to_string(options_.idle_timeout.count()) +
                               " ms");
      }

      inbound_message msg;
      try {
        msg = decode_inbound(text);
      } catch (const tunnel_error &e) {
        spdlog::warn("Ignoring relay message: {}", e.what());
        continue;
      }

      if (std::holds_alternative<pong_message>(msg)) {
        continue;
      }
      if (std::holds_alternative<ping_message>(msg)) {
        chan.send_text(encode_outbound(pong_message{}));
        continue;
      }
      if (auto *req = std::get_if<request_envelope>(&msg)) {
        handle_request(chan, *req);
        continue;
      }
      if (auto *err = std::get_if<relay_error>(&msg)) {
        spdlog::warn("Relay error: {}", err->message);
        continue;
      }
      if (auto *other = std::get_if<unknown_message>(&msg)) {
        spdlog::debug("Ignoring relay message of type \"{}\"", other->type);
        continue;
      }
      spdlog::debug("Ignoring unexpected auth reply");
    }
  }

  void handle_request(channel &chan, const request_envelope &req) {
    spdlog::info("-> {} {} ({})", req.method, req.path, req.id.substr(0, 16));

    response_envelope resp;
    try {
      resp = forward_(req);
    } catch (const std::exception &e) {
      resp = error_response(req.id, 500, e.what());
    }
    resp.id = req.id;

    chan.send_text(encode_outbound(resp));
    spdlog::info("<- {} ({} bytes)", resp.status, resp.body.size());
  }

  void report(const tunnel_error &e, const run_control &control) {
    switch (e.kind()) {
    case error_kind::connection:
      if (!control.stopped()) {
        spdlog::warn("Connection lost: {}", e.what());
      }
      return;
    case error_kind::protocol:
      spdlog::warn("Protocol error: {}", e.what());
      return;
    case error_kind::forwarding:
      spdlog::warn("Forwarding error: {}", e.what());
      return;
    }
  }

  void set_state(connection_state next) {
    auto prev = state_.exchange(next);
    if (prev != next) {
      spdlog::debug("state {} -> {}", to_string(prev), to_string(next));
    }
  }

  tunnel_options options_;
  connector_fn connector_;
  forward_fn forward_;
  reconnect_state reconnect_;

  std::atomic<connection_state> state_{connection_state::disconnected};
  mutable std::mutex session_mu_;
  std::optional<session_info> session_;
};

} // namespace burrow

#pragma once

#include "backoff.hpp"
#include "uri.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace burrow {

/// Production relay endpoint used when --relay is omitted.
constexpr std::string_view kDefaultRelayURL = "wss://tunnel.botroulette.net/ws";

struct tunnel_options {
  std::string relay_url = std::string(kDefaultRelayURL);
  std::string credential;
  std::string local_host = "localhost";
  int local_port = 0;

  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds handshake_timeout{10000};
  std::chrono::milliseconds heartbeat_interval{25000};
  std::chrono::milliseconds forward_timeout{25000};
  // Relay drops a silent connection after 90s; mirror that on our side.
  std::chrono::milliseconds idle_timeout{90000};
  delay_schedule backoff = default_backoff_schedule();

  bool verbose = false;
  bool show_help = false;
};

using env_lookup = std::function<const char *(const char *)>;

inline const char *process_env(const char *name) { return std::getenv(name); }

inline int parse_port(const std::string &text) {
  int port = 0;
  try {
    size_t used = 0;
    port = std::stoi(text, &used);
    if (used != text.size())
      throw std::invalid_argument(text);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("invalid port: " + text);
  }
  if (port <= 0 || port > 65535)
    throw std::invalid_argument("port out of range: " + text);
  return port;
}

/// Parse --key, --port, --relay and --verbose. RELAY_API_KEY, LOCAL_PORT
/// and RELAY_URL fill in whatever the flags leave out.
inline tunnel_options parse_options(const std::vector<std::string> &args,
                                    const env_lookup &env = process_env) {
  tunnel_options opts;
  std::string port_text;
  bool relay_set = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const auto &arg = args[i];
    bool has_value = i + 1 < args.size();
    if (arg == "--key" && has_value) {
      opts.credential = args[++i];
    } else if (arg == "--port" && has_value) {
      port_text = args[++i];
    } else if (arg == "--relay" && has_value) {
      opts.relay_url = args[++i];
      relay_set = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return opts;
    } else {
      throw std::invalid_argument("unknown or incomplete option: " + arg);
    }
  }

  if (opts.credential.empty()) {
    if (const char *value = env("RELAY_API_KEY"))
      opts.credential = value;
  }
  if (port_text.empty()) {
    if (const char *value = env("LOCAL_PORT"))
      port_text = value;
  }
  if (!relay_set) {
    if (const char *value = env("RELAY_URL"))
      opts.relay_url = value;
  }

  if (opts.credential.empty())
    throw std::invalid_argument("--key (or RELAY_API_KEY) is required");
  if (port_text.empty())
    throw std::invalid_argument("--port (or LOCAL_PORT) is required");
  opts.local_port = parse_port(port_text);

  // Throws for anything but a well-formed ws:// or wss:// URL.
  parse_uri(opts.relay_url);

  return opts;
}

constexpr std::string_view kUsage =
    "usage: burrow --key <api-key> --port <local-port> [--relay <url>] "
    "[--verbose]\n"
    "  --key      credential issued by the relay (env RELAY_API_KEY)\n"
    "  --port     port of the local HTTP service (env LOCAL_PORT)\n"
    "  --relay    relay websocket URL (env RELAY_URL)\n"
    "  --verbose  debug logging\n";

} // namespace burrow

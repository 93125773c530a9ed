#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>

namespace burrow {

/// Extract the scheme from a URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parsed relay URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
  bool secure = false;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    throw std::invalid_argument("missing host");

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    throw std::invalid_argument("missing host in " + addr);
  std::string port_text = addr.substr(pos + 1);
  if (port_text.empty())
    return {host, default_port};

  int port = 0;
  try {
    size_t used = 0;
    port = std::stoi(port_text, &used);
    if (used != port_text.size())
      throw std::invalid_argument(port_text);
  } catch (const std::logic_error &) {
    throw std::invalid_argument("invalid port in " + addr);
  }
  if (port <= 0 || port > 65535)
    throw std::invalid_argument("port out of range in " + addr);
  return {host, port};
}

/// Parse ws:// and wss:// URIs. The path keeps any query string
/// and defaults to "/".
inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);
  if (s != "ws" && s != "wss")
    throw std::invalid_argument("unsupported URI: " + uri);

  bool secure = s == "wss";
  std::string prefix = s + "://";
  if (uri.rfind(prefix, 0) != 0)
    throw std::invalid_argument("invalid URI: " + uri);

  std::string trimmed = uri.substr(prefix.size());
  auto slash = trimmed.find('/');
  std::string addr =
      slash == std::string::npos ? trimmed : trimmed.substr(0, slash);
  std::string path = slash == std::string::npos ? "/" : trimmed.substr(slash);

  auto [host, port] = split_host_port(addr, secure ? 443 : 80);
  return {uri, s, host, port, path, secure};
}

} // namespace burrow

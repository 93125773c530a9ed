#pragma once

#include "error.hpp"
#include "protocol.hpp"
#include "stream.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

namespace burrow {

enum class http_failure { unreachable, timed_out, other };

/// A failed local-service exchange. Always error_kind::forwarding.
class http_error : public tunnel_error {
public:
  http_error(http_failure failure, const std::string &message)
      : tunnel_error(error_kind::forwarding, message), failure_(failure) {}

  http_failure failure() const { return failure_; }

private:
  http_failure failure_;
};

struct http_request {
  std::string method = "GET";
  std::string target = "/"; // path plus optional ?query
  header_map headers;
  std::string body;
};

struct http_response {
  int status = 0;
  header_map headers;
  std::string body;
};

inline std::string to_lower(std::string_view text) {
  std::string out(text);
  for (auto &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

inline std::string trim(std::string_view text) {
  auto begin = text.find_first_not_of(" \t");
  if (begin == std::string_view::npos) {
    return std::string();
  }
  auto end = text.find_last_not_of(" \t\r");
  return std::string(text.substr(begin, end - begin + 1));
}

namespace detail {

/// Buffered reads over a socket_stream with one overall deadline.
class buffered_reader {
public:
  buffered_reader(socket_stream &stream, deadline until)
      : stream_(stream), until_(until) {}

  std::string read_line() {
    for (;;) {
      auto pos = buffer_.find("\r\n");
      if (pos != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 2);
        return line;
      }
      if (buffer_.size() > kMaxLine) {
        throw http_error(http_failure::other,
                         "local service sent an oversized header line");
      }
      if (!fill()) {
        throw http_error(http_failure::other,
                         "local service closed the connection mid-response");
      }
    }
  }

  std::string read_exact(size_t size) {
    while (buffer_.size() < size) {
      if (!fill()) {
        throw http_error(http_failure::other,
                         "local service closed the connection mid-body");
      }
    }
    std::string out = buffer_.substr(0, size);
    buffer_.erase(0, size);
    return out;
  }

  std::string read_to_eof() {
    while (fill()) {
    }
    std::string out;
    out.swap(buffer_);
    return out;
  }

private:
  /// Append more bytes. Returns false on orderly EOF.
  bool fill() {
    char chunk[8192];
    size_t got = 0;
    switch (stream_.read_some(chunk, sizeof(chunk), got, until_)) {
    case io_status::ok:
      buffer_.append(chunk, got);
      return true;
    case io_status::eof:
      return false;
    case io_status::timed_out:
      throw http_error(http_failure::timed_out, "local service timed out");
    case io_status::failed:
      break;
    }
    throw http_error(http_failure::other,
                     "reading from local service failed: " +
                         errno_text(errno));
  }

  static constexpr size_t kMaxLine = 64 * 1024;

  socket_stream &stream_;
  deadline until_;
  std::string buffer_;
};

inline bool parse_status_line(const std::string &line, http_response &resp) {
  if (line.rfind("HTTP/1.", 0) != 0) {
    return false;
  }
  auto sp = line.find(' ');
  if (sp == std::string::npos || line.size() < sp + 4) {
    return false;
  }
  std::string code = line.substr(sp + 1, 3);
  if (!std::all_of(code.begin(), code.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  resp.status = std::stoi(code);
  return true;
}

inline std::string read_chunked(buffered_reader &reader) {
  std::string body;
  for (;;) {
    std::string line = reader.read_line();
    auto semi = line.find(';');
    std::string size_text = trim(line.substr(0, semi));
    size_t size = 0;
    try {
      size_t used = 0;
      size = std::stoul(size_text, &used, 16);
      if (used != size_text.size()) {
        throw std::invalid_argument(size_text);
      }
    } catch (const std::logic_error &) {
      throw http_error(http_failure::other,
                       "local service sent a bad chunk size");
    }
    if (size == 0) {
      while (!reader.read_line().empty()) {
        // trailers are dropped
      }
      return body;
    }
    body += reader.read_exact(size);
    if (!reader.read_line().empty()) {
      throw http_error(http_failure::other,
                       "local service sent a malformed chunk");
    }
  }
}

} // namespace detail

/// Minimal HTTP/1.1 client for the local service: one request per
/// connection, one deadline covering connect, write and read.
class http_client {
public:
  http_client(std::string host, int port, std::chrono::milliseconds timeout)
      : host_(std::move(host)), port_(port), timeout_(timeout) {}

  const std::string &host() const { return host_; }
  int port() const { return port_; }

  /// Throws http_error on any failure.
  http_response send(const http_request &req) const {
    deadline until = deadline_after(timeout_);

    int fd = -1;
    try {
      fd = dial_tcp(host_, port_, until);
    } catch (const dial_error &e) {
      throw http_error(e.failure() == dial_failure::timed_out
                           ? http_failure::timed_out
                           : http_failure::unreachable,
                       e.what());
    }
    socket_stream stream(fd);

    std::string head = serialize_head(req);
    switch (stream.write_all(head.data(), head.size(), until)) {
    case io_status::ok:
      break;
    case io_status::timed_out:
      throw http_error(http_failure::timed_out, "local service timed out");
    default:
      throw http_error(http_failure::other,
                       "writing to local service failed: " +
                           errno_text(errno));
    }
    if (!req.body.empty()) {
      switch (stream.write_all(req.body.data(), req.body.size(), until)) {
      case io_status::ok:
        break;
      case io_status::timed_out:
        throw http_error(http_failure::timed_out, "local service timed out");
      default:
        throw http_error(http_failure::other,
                         "writing to local service failed: " +
                             errno_text(errno));
      }
    }

    detail::buffered_reader reader(stream, until);
    http_response resp;
    do {
      resp = http_response();
      if (!detail::parse_status_line(reader.read_line(), resp)) {
        throw http_error(http_failure::other,
                         "local service sent a malformed status line");
      }
      read_headers(reader, resp);
    } while (resp.status >= 100 && resp.status < 200);

    bool no_body = iequals(req.method, "HEAD") || resp.status == 204 ||
                   resp.status == 304;
    if (no_body) {
      return resp;
    }

    std::string transfer = to_lower(find_header(resp.headers,
                                                "transfer-encoding"));
    std::string length = find_header(resp.headers, "content-length");
    if (transfer.find("chunked") != std::string::npos) {
      resp.body = detail::read_chunked(reader);
    } else if (!length.empty()) {
      size_t size = 0;
      try {
        size = std::stoul(length);
      } catch (const std::logic_error &) {
        throw http_error(http_failure::other,
                         "local service sent a bad Content-Length");
      }
      resp.body = reader.read_exact(size);
    } else {
      resp.body = reader.read_to_eof();
    }
    return resp;
  }

  /// Case-insensitive header lookup; empty when absent.
  static std::string find_header(const header_map &headers,
                                 std::string_view name) {
    for (const auto &kv : headers) {
      if (iequals(kv.first, name)) {
        return kv.second;
      }
    }
    return std::string();
  }

private:
  std::string serialize_head(const http_request &req) const {
    std::ostringstream out;
    out << req.method << " " << req.target << " HTTP/1.1\r\n";
    out << "Host: " << host_ << ":" << port_ << "\r\n";
    for (const auto &kv : req.headers) {
      // Framing is owned by this client.
      if (iequals(kv.first, "host") || iequals(kv.first, "connection") ||
          iequals(kv.first, "content-length") ||
          iequals(kv.first, "transfer-encoding")) {
        continue;
      }
      out << kv.first << ": " << kv.second << "\r\n";
    }
    if (!req.body.empty() || (!iequals(req.method, "GET") &&
                              !iequals(req.method, "HEAD"))) {
      out << "Content-Length: " << req.body.size() << "\r\n";
    }
    out << "Connection: close\r\n\r\n";
    return out.str();
  }

  static void read_headers(detail::buffered_reader &reader,
                           http_response &resp) {
    for (;;) {
      std::string line = reader.read_line();
      if (line.empty()) {
        return;
      }
      auto colon = line.find(':');
      if (colon == std::string::npos || colon == 0) {
        throw http_error(http_failure::other,
                         "local service sent a malformed header");
      }
      std::string name = line.substr(0, colon);
      std::string value = trim(std::string_view(line).substr(colon + 1));

      auto existing = std::find_if(
          resp.headers.begin(), resp.headers.end(),
          [&name](const auto &kv) { return iequals(kv.first, name); });
      if (existing != resp.headers.end()) {
        existing->second += ", " + value;
      } else {
        resp.headers.emplace(name, value);
      }
    }
  }

  std::string host_;
  int port_;
  std::chrono::milliseconds timeout_;
};

} // namespace burrow

#pragma once

#include "error.hpp"
#include "stream.hpp"
#include "uri.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace burrow {

/// A bidirectional text-message stream to the relay.
class channel {
public:
  virtual ~channel() = default;

  /// Send one text message. Throws tunnel_error(connection) on failure.
  /// Safe to call from two threads at once.
  virtual void send_text(const std::string &text) = 0;

  /// Wait for the next text message. Returns false if `timeout` (<= 0 means
  /// forever) elapses first; throws tunnel_error(connection) once the
  /// channel is closed or broken.
  virtual bool receive_text(std::string &out,
                            std::chrono::milliseconds timeout) = 0;

  /// Wake a blocked receive_text() so it fails. Safe from any thread.
  virtual void interrupt() = 0;
};

constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

inline std::string base64_encode(const uint8_t *data, size_t size) {
  std::string out(4 * ((size + 2) / 3), '\0');
  int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                            data, static_cast<int>(size));
  out.resize(static_cast<size_t>(n));
  return out;
}

/// Sec-WebSocket-Accept value expected for a given Sec-WebSocket-Key.
inline std::string websocket_accept_key(const std::string &key) {
  std::string joined = key + "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
  unsigned char digest[SHA_DIGEST_LENGTH];
  ::SHA1(reinterpret_cast<const unsigned char *>(joined.data()), joined.size(),
         digest);
  return base64_encode(digest, sizeof(digest));
}

/// Websocket client channel over TCP (ws://) or TLS (wss://).
class ws_channel : public channel {
public:
  static std::unique_ptr<ws_channel>
  connect(const std::string &url, std::chrono::milliseconds timeout) {
    parsed_uri parsed;
    try {
      parsed = parse_uri(url);
    } catch (const std::invalid_argument &e) {
      throw connection_error(e.what());
    }
    deadline until = deadline_after(timeout);
    int fd = -1;
    try {
      fd = dial_tcp(parsed.host, parsed.port, until);
    } catch (const dial_error &e) {
      throw connection_error(e.what());
    }

    auto stream = std::make_unique<socket_stream>(fd);
    if (parsed.secure) {
      stream->start_tls(parsed.host, until);
    }
    upgrade(*stream, parsed, until);
    return std::unique_ptr<ws_channel>(new ws_channel(std::move(stream)));
  }

  ~ws_channel() override { close(); }

  void send_text(const std::string &text) override {
    if (!send_frame(0x1, text)) {
      throw connection_error("websocket send failed");
    }
  }

  bool receive_text(std::string &out,
                    std::chrono::milliseconds timeout) override {
    out.clear();
    std::string fragmented;
    bool reading_fragment = false;
    deadline until = deadline_after(timeout);

    for (;;) {
      uint8_t header[2];
      if (!check(stream_->read_exact(header, 2, until))) {
        return false;
      }

      bool fin = (header[0] & 0x80) != 0;
      uint8_t opcode = static_cast<uint8_t>(header[0] & 0x0F);
      bool masked = (header[1] & 0x80) != 0;
      uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

      if (len == 126) {
        uint8_t ext[2];
        if (!check(stream_->read_exact(ext, 2, until))) {
          return false;
        }
        len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
      } else if (len == 127) {
        uint8_t ext[8];
        if (!check(stream_->read_exact(ext, 8, until))) {
          return false;
        }
        len = 0;
        for (int i = 0; i < 8; ++i) {
          len = (len << 8) | ext[i];
        }
      }
      if (len > kMaxFrameSize) {
        throw connection_error("websocket frame too large");
      }

      std::array<uint8_t, 4> mask{};
      if (masked && !check(stream_->read_exact(mask.data(), mask.size(),
                                               until))) {
        return false;
      }

      std::string payload(len, '\0');
      if (len > 0 && !check(stream_->read_exact(payload.data(), len, until))) {
        return false;
      }
      if (masked) {
        for (size_t i = 0; i < payload.size(); ++i) {
          payload[i] = static_cast<char>(payload[i] ^ mask[i % 4]);
        }
      }

      if (opcode == 0x8) { // close
        closing_ = true;
        (void)send_frame(0x8, payload.substr(0, 2)); // echo, best effort
        throw connection_error("relay closed the connection");
      }
      if (opcode == 0x9) { // ping
        if (!send_frame(0xA, payload)) {
          throw connection_error("websocket pong failed");
        }
        continue;
      }
      if (opcode == 0xA) { // pong
        continue;
      }

      if (opcode == 0x1 || opcode == 0x0) { // text or continuation
        if (opcode == 0x1 && !reading_fragment) {
          fragmented.clear();
        }
        fragmented.append(payload);
        if (fragmented.size() > kMaxFrameSize) {
          throw connection_error("websocket message too large");
        }
        reading_fragment = !fin;
        if (fin) {
          out = std::move(fragmented);
          return true;
        }
        continue;
      }
      throw connection_error("unexpected websocket opcode " +
                             std::to_string(opcode));
    }
  }

  void interrupt() override { stream_->shutdown(); }

  bool secure() const { return stream_->secure(); }

  /// Send a close frame if none was exchanged yet, then drop the socket.
  void close() {
    if (!closing_) {
      closing_ = true;
      // 1000: normal closure. The peer may already be gone.
      const char code[2] = {0x03, static_cast<char>(0xE8)};
      (void)send_frame(0x8, std::string(code, 2));
    }
    stream_->close();
  }

private:
  explicit ws_channel(std::unique_ptr<socket_stream> stream)
      : stream_(std::move(stream)) {}

  static void upgrade(socket_stream &stream, const parsed_uri &parsed,
                      deadline until) {
    std::array<uint8_t, 16> nonce{};
    if (::RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
      throw connection_error("cannot generate websocket key");
    }
    std::string key = base64_encode(nonce.data(), nonce.size());

    bool default_port = parsed.port == (parsed.secure ? 443 : 80);
    std::ostringstream req;
    req << "GET " << parsed.path << " HTTP/1.1\r\n";
    req << "Host: " << parsed.host;
    if (!default_port) {
      req << ":" << parsed.port;
    }
    req << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: " << key << "\r\n";
    req << "Sec-WebSocket-Version: 13\r\n\r\n";

    auto req_str = req.str();
    if (stream.write_all(req_str.data(), req_str.size(), until) !=
        io_status::ok) {
      throw connection_error("websocket upgrade request failed");
    }

    std::string headers;
    headers.reserve(1024);
    char ch = 0;
    while (headers.find("\r\n\r\n") == std::string::npos) {
      io_status status = stream.read_exact(&ch, 1, until);
      if (status == io_status::timed_out) {
        throw connection_error("websocket upgrade timed out");
      }
      if (status != io_status::ok) {
        throw connection_error("relay closed during websocket upgrade");
      }
      headers.push_back(ch);
      if (headers.size() > 16384) {
        throw connection_error("websocket handshake too large");
      }
    }

    std::string lower = headers;
    for (auto &c : lower) {
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto line_end = lower.find("\r\n");
    if (lower.substr(0, line_end).find(" 101") == std::string::npos) {
      throw connection_error("relay refused websocket upgrade: " +
                             headers.substr(0, headers.find("\r\n")));
    }

    const std::string field = "\r\nsec-websocket-accept:";
    auto pos = lower.find(field);
    if (pos == std::string::npos) {
      throw connection_error("relay did not send Sec-WebSocket-Accept");
    }
    auto value_begin = headers.find_first_not_of(" \t", pos + field.size());
    auto value_end = headers.find("\r\n", value_begin);
    std::string accept = headers.substr(value_begin, value_end - value_begin);
    while (!accept.empty() && (accept.back() == ' ' || accept.back() == '\t')) {
      accept.pop_back();
    }
    if (accept != websocket_accept_key(key)) {
      throw connection_error("relay sent a bad Sec-WebSocket-Accept");
    }
  }

  /// Map a read status: true to continue, false on timeout, throw otherwise.
  static bool check(io_status status) {
    switch (status) {
    case io_status::ok:
      return true;
    case io_status::timed_out:
      return false;
    case io_status::eof:
      throw connection_error("relay connection closed");
    case io_status::failed:
      break;
    }
    throw connection_error("relay connection failed");
  }

  bool send_frame(uint8_t opcode, const std::string &payload) {
    std::vector<uint8_t> frame;
    frame.reserve(payload.size() + 16);
    frame.push_back(static_cast<uint8_t>(0x80 | (opcode & 0x0F)));

    uint64_t len = payload.size();
    if (len < 126) {
      frame.push_back(static_cast<uint8_t>(0x80 | len));
    } else if (len <= 0xFFFF) {
      frame.push_back(static_cast<uint8_t>(0x80 | 126));
      frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
      frame.push_back(static_cast<uint8_t>(len & 0xFF));
    } else {
      frame.push_back(static_cast<uint8_t>(0x80 | 127));
      for (int i = 7; i >= 0; --i) {
        frame.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
      }
    }

    std::array<uint8_t, 4> mask{};
    if (::RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
      return false;
    }
    frame.insert(frame.end(), mask.begin(), mask.end());

    for (size_t i = 0; i < payload.size(); ++i) {
      frame.push_back(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]);
    }

    std::lock_guard<std::mutex> lock(send_mu_);
    return stream_->write_all(frame.data(), frame.size(),
                              deadline_after(kSendTimeout)) == io_status::ok;
  }

  static constexpr std::chrono::milliseconds kSendTimeout{30000};

  std::unique_ptr<socket_stream> stream_;
  std::mutex send_mu_;
  std::atomic<bool> closing_{false};
};

} // namespace burrow

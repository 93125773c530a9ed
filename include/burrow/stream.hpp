#pragma once

#include "error.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace burrow {

using steady_clock = std::chrono::steady_clock;
using deadline = steady_clock::time_point;

inline deadline no_deadline() { return deadline::max(); }

inline deadline deadline_after(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return no_deadline();
  }
  return steady_clock::now() + timeout;
}

/// poll(2) a single descriptor until `until`. Returns >0 when ready, 0 on
/// timeout and <0 on error. Never reports a timeout before `until`.
inline int poll_until(int fd, short events, deadline until) {
  for (;;) {
    int timeout_ms = -1;
    if (until != no_deadline()) {
      auto now = steady_clock::now();
      if (now >= until) {
        return 0;
      }
      auto left = std::chrono::ceil<std::chrono::milliseconds>(until - now);
      timeout_ms = left.count() > INT_MAX ? INT_MAX
                                          : static_cast<int>(left.count());
    }
    pollfd p{fd, events, 0};
    int rc = ::poll(&p, 1, timeout_ms);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    if (rc == 0 && until != no_deadline() && steady_clock::now() < until) {
      continue;
    }
    return rc;
  }
}

inline std::string errno_text(int err) { return std::strerror(err); }

/// Drain the OpenSSL error queue into a readable string.
inline std::string openssl_error_text() {
  std::string text;
  unsigned long code = 0;
  while ((code = ::ERR_get_error()) != 0) {
    char buf[256];
    ::ERR_error_string_n(code, buf, sizeof(buf));
    if (!text.empty()) {
      text += "; ";
    }
    text += buf;
  }
  return text.empty() ? "unknown TLS error" : text;
}

enum class dial_failure { unreachable, timed_out };

class dial_error : public std::runtime_error {
public:
  dial_error(dial_failure failure, const std::string &message)
      : std::runtime_error(message), failure_(failure) {}

  dial_failure failure() const { return failure_; }

private:
  dial_failure failure_;
};

/// Resolve `host` and connect to the first address that accepts, with a
/// non-blocking connect bounded by `until`. Returns a non-blocking fd.
inline int dial_tcp(const std::string &host, int port, deadline until) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints,
                         &res);
  if (rc != 0) {
    throw dial_error(dial_failure::unreachable,
                     "cannot resolve " + host + ": " + ::gai_strerror(rc));
  }
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res,
                                                             &::freeaddrinfo);

  std::string target = host + ":" + std::to_string(port);
  std::string last_error = "no usable address";
  for (auto *ai = res; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      last_error = errno_text(errno);
      continue;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error = errno_text(errno);
      ::close(fd);
      continue;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      return fd;
    }
    if (errno != EINPROGRESS) {
      last_error = errno_text(errno);
      ::close(fd);
      continue;
    }

    int ready = poll_until(fd, POLLOUT, until);
    if (ready == 0) {
      ::close(fd);
      throw dial_error(dial_failure::timed_out,
                       "connect to " + target + " timed out");
    }
    int err = 0;
    if (ready < 0) {
      err = errno;
    } else {
      socklen_t len = sizeof(err);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        err = errno;
      }
    }
    if (err == 0) {
      return fd;
    }
    last_error = errno_text(err);
    ::close(fd);
  }
  throw dial_error(dial_failure::unreachable,
                   "connect to " + target + " failed: " + last_error);
}

/// Process-wide client TLS context: system trust store, peer verification,
/// TLS 1.2 or newer.
inline SSL_CTX *client_tls_context() {
  static std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)> ctx = []() {
    std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)> made(
        ::SSL_CTX_new(::TLS_client_method()), &::SSL_CTX_free);
    if (!made) {
      throw connection_error("cannot create TLS context: " +
                             openssl_error_text());
    }
    ::SSL_CTX_set_min_proto_version(made.get(), TLS1_2_VERSION);
    if (::SSL_CTX_set_default_verify_paths(made.get()) != 1) {
      throw connection_error("cannot load system trust store: " +
                             openssl_error_text());
    }
    ::SSL_CTX_set_verify(made.get(), SSL_VERIFY_PEER, nullptr);
    return made;
  }();
  return ctx.get();
}

enum class io_status { ok, eof, timed_out, failed };

/// A connected non-blocking socket, optionally wrapped in TLS. Every OpenSSL
/// call is serialized on io_mu_ so one thread may read while another
/// writes; the lock is never held across poll().
class socket_stream {
public:
  explicit socket_stream(int fd) : fd_(fd) {}
  ~socket_stream() { close(); }

  socket_stream(const socket_stream &) = delete;
  socket_stream &operator=(const socket_stream &) = delete;

  bool secure() const { return ssl_ != nullptr; }

  void start_tls(const std::string &host, deadline until) {
    SSL *ssl = ::SSL_new(client_tls_context());
    if (ssl == nullptr) {
      throw connection_error("SSL_new failed: " + openssl_error_text());
    }
    ssl_ = ssl;
    ::SSL_set_fd(ssl_, fd_);
    ::SSL_set_tlsext_host_name(ssl_, host.c_str());
    ::SSL_set1_host(ssl_, host.c_str());

    for (;;) {
      ::ERR_clear_error();
      int rc = ::SSL_connect(ssl_);
      if (rc == 1) {
        return;
      }
      short events = 0;
      switch (::SSL_get_error(ssl_, rc)) {
      case SSL_ERROR_WANT_READ:
        events = POLLIN;
        break;
      case SSL_ERROR_WANT_WRITE:
        events = POLLOUT;
        break;
      default: {
        std::string reason = openssl_error_text();
        long verify = ::SSL_get_verify_result(ssl_);
        if (verify != X509_V_OK) {
          reason = ::X509_verify_cert_error_string(verify);
        }
        throw connection_error("TLS handshake with " + host +
                               " failed: " + reason);
      }
      }
      int ready = poll_until(fd_, events, until);
      if (ready == 0) {
        throw connection_error("TLS handshake with " + host + " timed out");
      }
      if (ready < 0) {
        throw connection_error("TLS handshake with " + host +
                               " failed: " + errno_text(errno));
      }
    }
  }

  /// Read up to `size` bytes into `data`; `got` is set on io_status::ok.
  io_status read_some(void *data, size_t size, size_t &got, deadline until) {
    for (;;) {
      short events = POLLIN;
      {
        std::lock_guard<std::mutex> lock(io_mu_);
        if (ssl_ != nullptr) {
          ::ERR_clear_error();
          int n = ::SSL_read(ssl_, data, static_cast<int>(
                                             std::min<size_t>(size, INT_MAX)));
          if (n > 0) {
            got = static_cast<size_t>(n);
            return io_status::ok;
          }
          int err = ::SSL_get_error(ssl_, n);
          if (err == SSL_ERROR_ZERO_RETURN) {
            return io_status::eof;
          }
          if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
          } else if (err != SSL_ERROR_WANT_READ) {
            return io_status::failed;
          }
        } else {
          ssize_t n = ::recv(fd_, data, size, 0);
          if (n > 0) {
            got = static_cast<size_t>(n);
            return io_status::ok;
          }
          if (n == 0) {
            return io_status::eof;
          }
          if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            return io_status::failed;
          }
        }
      }
      int ready = poll_until(fd_, events, until);
      if (ready == 0) {
        return io_status::timed_out;
      }
      if (ready < 0) {
        return io_status::failed;
      }
    }
  }

  io_status read_exact(void *data, size_t size, deadline until) {
    auto *ptr = static_cast<uint8_t *>(data);
    size_t have = 0;
    while (have < size) {
      size_t got = 0;
      io_status status = read_some(ptr + have, size - have, got, until);
      if (status != io_status::ok) {
        return status;
      }
      have += got;
    }
    return io_status::ok;
  }

  io_status write_all(const void *data, size_t size, deadline until) {
    const auto *ptr = static_cast<const uint8_t *>(data);
    size_t sent = 0;
    while (sent < size) {
      short events = POLLOUT;
      {
        std::lock_guard<std::mutex> lock(io_mu_);
        if (ssl_ != nullptr) {
          ::ERR_clear_error();
          int n = ::SSL_write(ssl_, ptr + sent,
                              static_cast<int>(
                                  std::min<size_t>(size - sent, INT_MAX)));
          if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
          }
          int err = ::SSL_get_error(ssl_, n);
          if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
          } else if (err != SSL_ERROR_WANT_WRITE) {
            return io_status::failed;
          }
        } else {
          ssize_t n = ::send(fd_, ptr + sent, size - sent, MSG_NOSIGNAL);
          if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
          }
          if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
              errno != EINTR) {
            return io_status::failed;
          }
        }
      }
      int ready = poll_until(fd_, events, until);
      if (ready == 0) {
        return io_status::timed_out;
      }
      if (ready < 0) {
        return io_status::failed;
      }
    }
    return io_status::ok;
  }

  /// Wake any thread blocked on this stream. Safe from any thread.
  void shutdown() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  void close() {
    std::lock_guard<std::mutex> lock(io_mu_);
    if (ssl_ != nullptr) {
      ::SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_;
  SSL *ssl_ = nullptr;
  std::mutex io_mu_;
};

} // namespace burrow

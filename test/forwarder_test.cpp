#include "test_util.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>

namespace {

using json = nlohmann::json;
using namespace std::chrono_literals;

burrow::request_forwarder local_forwarder(int port,
                                          std::chrono::milliseconds timeout =
                                              2000ms) {
  return burrow::request_forwarder("127.0.0.1", port, timeout);
}

std::string error_field(const burrow::response_envelope &resp) {
  return json::parse(resp.body).at("error").get<std::string>();
}

} // namespace

int main() {
  int passed = 0;

  // --- header filtering ---
  {
    burrow::header_map in{{"Host", "relay.example.net"},
                          {"CONNECTION", "keep-alive"},
                          {"host", "dup"},
                          {"Accept", "application/json"},
                          {"X-Connection-Id", "42"}};
    auto out = burrow::forwardable_headers(in);
    assert(out.size() == 2);
    ++passed;
    assert(out.count("Accept") == 1);
    ++passed;
    assert(out.count("X-Connection-Id") == 1);
    ++passed;
    for (const auto &kv : out) {
      assert(!burrow::iequals(kv.first, "host"));
      assert(!burrow::iequals(kv.first, "connection"));
    }
    ++passed;
  }

  // --- request target ---
  assert(burrow::request_target("/x", "") == "/x");
  ++passed;
  assert(burrow::request_target("/search", "q=1&n=2") == "/search?q=1&n=2");
  ++passed;
  assert(burrow::request_target("", "") == "/");
  ++passed;

  // --- successful passthrough ---
  {
    test_util::http_stub stub("HTTP/1.1 200 OK\r\n"
                              "Content-Type: application/json\r\n"
                              "X-Custom: 1\r\n"
                              "Content-Length: 11\r\n"
                              "\r\n"
                              "{\"ok\":true}");
    burrow::request_envelope req;
    req.id = "req-200";
    req.method = "GET";
    req.path = "/x";
    req.headers = {{"Host", "relay.example.net"},
                   {"connection", "keep-alive"},
                   {"X-Trace", "abc"}};

    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.id == "req-200");
    ++passed;
    assert(resp.status == 200);
    ++passed;
    assert(resp.body == "{\"ok\":true}");
    ++passed;
    assert(resp.headers.at("Content-Type") == "application/json");
    ++passed;
    assert(resp.headers.at("X-Custom") == "1");
    ++passed;
    assert(resp.headers.at("Content-Length") == "11");
    ++passed;

    auto sent = stub.requests();
    assert(sent.size() == 1);
    ++passed;
    assert(sent[0].rfind("GET /x HTTP/1.1\r\n", 0) == 0);
    ++passed;
    assert(sent[0].find("X-Trace: abc\r\n") != std::string::npos);
    ++passed;
    assert(sent[0].find("relay.example.net") == std::string::npos);
    ++passed;
    assert(sent[0].find("keep-alive") == std::string::npos);
    ++passed;

    auto wire = json::parse(burrow::encode_outbound(resp));
    assert(wire["type"] == "response");
    ++passed;
    assert(wire["id"] == "req-200");
    ++passed;
    assert(wire["status"] == 200);
    ++passed;
    assert(wire["body"] == "{\"ok\":true}");
    ++passed;
  }

  // --- query string and body ---
  {
    test_util::http_stub stub("HTTP/1.1 201 Created\r\n"
                              "Content-Length: 0\r\n\r\n");
    burrow::request_envelope req;
    req.id = "req-post";
    req.method = "POST";
    req.path = "/chat";
    req.query_string = "lang=en";
    req.headers = {{"Content-Type", "application/json"},
                   {"Content-Length", "999"}};
    req.body = R"({"message":"hi"})";

    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.status == 201);
    ++passed;
    assert(resp.body.empty());
    ++passed;

    auto sent = stub.requests();
    assert(sent.size() == 1);
    ++passed;
    assert(sent[0].rfind("POST /chat?lang=en HTTP/1.1\r\n", 0) == 0);
    ++passed;
    assert(sent[0].find("Content-Length: 16\r\n") != std::string::npos);
    ++passed;
    assert(sent[0].find("999") == std::string::npos);
    ++passed;
    assert(sent[0].size() > req.body.size() &&
           sent[0].compare(sent[0].size() - req.body.size(),
                           req.body.size(), req.body) == 0);
    ++passed;
  }

  // --- non-2xx statuses pass through ---
  {
    test_util::http_stub stub("HTTP/1.1 404 Not Found\r\n"
                              "Content-Length: 9\r\n\r\n"
                              "not found");
    burrow::request_envelope req;
    req.id = "req-404";
    req.method = "GET";
    req.path = "/missing";
    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.status == 404);
    ++passed;
    assert(resp.body == "not found");
    ++passed;
  }

  // --- chunked body ---
  {
    test_util::http_stub stub("HTTP/1.1 200 OK\r\n"
                              "Transfer-Encoding: chunked\r\n\r\n"
                              "5\r\nhello\r\n"
                              "6;ext=1\r\n world\r\n"
                              "0\r\n\r\n");
    burrow::request_envelope req;
    req.id = "req-chunked";
    req.method = "GET";
    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.status == 200);
    ++passed;
    assert(resp.body == "hello world");
    ++passed;
  }

  // --- body delimited by close, repeated headers ---
  {
    test_util::http_stub stub("HTTP/1.0 200 OK\r\n"
                              "Set-Cookie: a=1\r\n"
                              "Set-Cookie: b=2\r\n\r\n"
                              "streamed until close");
    burrow::request_envelope req;
    req.id = "req-close";
    req.method = "GET";
    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.body == "streamed until close");
    ++passed;
    assert(resp.headers.at("Set-Cookie") == "a=1, b=2");
    ++passed;
  }

  // --- nothing listening: 502 ---
  {
    burrow::request_envelope req;
    req.id = "req-502";
    req.method = "POST";
    req.path = "/chat";
    req.body = R"({"message":"hi"})";
    auto resp = local_forwarder(test_util::unused_port()).forward(req);
    assert(resp.id == "req-502");
    ++passed;
    assert(resp.status == 502);
    ++passed;
    assert(error_field(resp) == "Cannot reach local service");
    ++passed;
    assert(resp.headers.at("content-type") == "application/json");
    ++passed;
  }

  // --- no reply within the timeout: 504 ---
  {
    test_util::silent_server silent;
    burrow::request_envelope req;
    req.id = "req-504";
    req.method = "GET";
    req.path = "/slow";
    auto started = std::chrono::steady_clock::now();
    auto resp = local_forwarder(silent.port(), 200ms).forward(req);
    auto elapsed = std::chrono::steady_clock::now() - started;
    assert(resp.status == 504);
    ++passed;
    assert(error_field(resp) == "Local service timed out");
    ++passed;
    assert(elapsed >= 200ms && elapsed < 5s);
    ++passed;
  }

  // --- garbage reply: 500 ---
  {
    test_util::http_stub stub("SSH-2.0-OpenSSH_9.6\r\n\r\n");
    burrow::request_envelope req;
    req.id = "req-500";
    req.method = "GET";
    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.status == 500);
    ++passed;
    assert(!error_field(resp).empty());
    ++passed;
  }

  // --- reply cut short: 500 ---
  {
    test_util::http_stub stub("HTTP/1.1 200 OK\r\n"
                              "Content-Length: 100\r\n\r\n"
                              "short");
    burrow::request_envelope req;
    req.id = "req-short";
    req.method = "GET";
    auto resp = local_forwarder(stub.port()).forward(req);
    assert(resp.status == 500);
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}

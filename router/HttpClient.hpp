// Minimal blocking HTTP/1.1 client for the router's web console (http and https)
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tomexp::router {

struct HttpRequest {
  std::string method = "GET";
  std::string path = "/";
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::chrono::milliseconds timeout{10000};  // whole exchange, connect excluded
};

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // names lower-cased
  std::string body;                            // de-chunked
};

// Seam between the console adapter and the network. Tests script it.
class Transport {
 public:
  virtual ~Transport() = default;
  // Returns false with err set on resolve/connect/send/recv failure or timeout.
  virtual bool Send(const HttpRequest& req, HttpResponse& resp, std::string& err) = 0;
};

struct Endpoint {
  std::string scheme = "http";
  std::string host;
  int         port = 80;
  bool        verify_tls = false;
  std::chrono::milliseconds connect_timeout{5000};
};

class SocketTransport : public Transport {
 public:
  explicit SocketTransport(Endpoint ep);
  ~SocketTransport() override;
  SocketTransport(const SocketTransport&) = delete;
  SocketTransport& operator=(const SocketTransport&) = delete;

  bool Send(const HttpRequest& req, HttpResponse& resp, std::string& err) override;

 private:
  struct TlsState;
  Endpoint ep_;
  std::unique_ptr<TlsState> tls_;  // null for plain http
};

std::string Base64Encode(std::string_view in);
std::string BasicAuthorization(const std::string& user, const std::string& pass);
std::string FormUrlEncode(const std::vector<std::pair<std::string, std::string>>& fields);

// Whether `raw` already holds the whole response: headers plus a Content-Length
// or chunked body. Close-delimited responses are complete only at EOF.
bool ResponseComplete(std::string_view raw);

// Parses a full raw response (status line, headers, body). Handles chunked transfer coding.
bool ParseHttpResponse(std::string_view raw, HttpResponse& out, std::string& err);

} // namespace tomexp::router

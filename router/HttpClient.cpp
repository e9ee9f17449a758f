#include "router/HttpClient.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <string>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tomexp::router {

using Clock = std::chrono::steady_clock;

struct SocketTransport::TlsState {
  struct CtxDeleter {
    void operator()(SSL_CTX* p) const noexcept { SSL_CTX_free(p); }
  };
  std::unique_ptr<SSL_CTX, CtxDeleter> ctx;
};

namespace {

constexpr std::size_t kMaxResponseBytes = 8u << 20;

std::string LastSslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) return "unknown TLS error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

int RemainingMs(Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

bool WaitFd(int fd, short events, Clock::time_point deadline, std::string& err) {
  for (;;) {
    const int left = RemainingMs(deadline);
    if (left == 0) { err = "timed out"; return false; }
    pollfd p{};
    p.fd = fd;
    p.events = events;
    const int rc = ::poll(&p, 1, left);
    if (rc > 0) return true;
    if (rc == 0) { err = "timed out"; return false; }
    if (errno == EINTR) continue;
    err = std::string("poll: ") + std::strerror(errno);
    return false;
  }
}

std::string Lower(std::string_view sv) {
  std::string out(sv);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view TrimView(std::string_view sv) {
  const auto l = sv.find_first_not_of(" \t\r\n");
  if (l == std::string_view::npos) return {};
  const auto r = sv.find_last_not_of(" \t\r\n");
  return sv.substr(l, r - l + 1);
}

// Non-blocking socket (optionally wrapped in TLS), closed on destruction.
class Connection {
 public:
  Connection() = default;
  ~Connection() { Close(); }
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  bool Open(const Endpoint& ep, SSL_CTX* ctx, Clock::time_point deadline, std::string& err) {
    if (!ConnectTcp(ep, deadline, err)) return false;
    if (ctx == nullptr) return true;
    return Handshake(ep, ctx, deadline, err);
  }

  bool WriteAll(std::string_view data, Clock::time_point deadline, std::string& err) {
    std::size_t off = 0;
    while (off < data.size()) {
      if (ssl_ != nullptr) {
        const int n = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
        if (n > 0) { off += static_cast<std::size_t>(n); continue; }
        const short ev = WantedEvents(SSL_get_error(ssl_, n));
        if (ev == 0) { err = "tls write: " + LastSslError(); return false; }
        if (!WaitFd(fd_, ev, deadline, err)) { err = "send: " + err; return false; }
        continue;
      }
      const ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
      if (n >= 0) { off += static_cast<std::size_t>(n); continue; }
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!WaitFd(fd_, POLLOUT, deadline, err)) { err = "send: " + err; return false; }
        continue;
      }
      err = std::string("send: ") + std::strerror(errno);
      return false;
    }
    return true;
  }

  // >0 bytes read, 0 on end of stream, -1 on error
  long ReadSome(char* buf, std::size_t len, Clock::time_point deadline, std::string& err) {
    for (;;) {
      if (ssl_ != nullptr) {
        const int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) return n;
        const int e = SSL_get_error(ssl_, n);
        // routers often drop the connection without close_notify
        if (e == SSL_ERROR_ZERO_RETURN || (e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) return 0;
        const short ev = WantedEvents(e);
        if (ev == 0) { err = "tls read: " + LastSslError(); return -1; }
        if (!WaitFd(fd_, ev, deadline, err)) { err = "recv: " + err; return -1; }
        continue;
      }
      const ssize_t n = ::recv(fd_, buf, len, 0);
      if (n >= 0) return static_cast<long>(n);
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!WaitFd(fd_, POLLIN, deadline, err)) { err = "recv: " + err; return -1; }
        continue;
      }
      err = std::string("recv: ") + std::strerror(errno);
      return -1;
    }
  }

 private:
  static short WantedEvents(int ssl_error) {
    if (ssl_error == SSL_ERROR_WANT_READ) return POLLIN;
    if (ssl_error == SSL_ERROR_WANT_WRITE) return POLLOUT;
    return 0;
  }

  bool ConnectTcp(const Endpoint& ep, Clock::time_point deadline, std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    addrinfo* addrs = nullptr;
    const std::string port = std::to_string(ep.port);
    if (const int rc = ::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &addrs); rc != 0) {
      err = std::string("resolve: ") + ::gai_strerror(rc);
      return false;
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(addrs, &::freeaddrinfo);

    err.clear();
    for (addrinfo* ai = addrs; ai != nullptr; ai = ai->ai_next) {
      const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
      if (fd < 0) {
        err = std::string("socket: ") + std::strerror(errno);
        continue;
      }
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        fd_ = fd;
        return true;
      }
      if (errno != EINPROGRESS) {
        err = std::string("connect: ") + std::strerror(errno);
        ::close(fd);
        continue;
      }
      std::string werr;
      if (!WaitFd(fd, POLLOUT, deadline, werr)) {
        err = "connect: " + werr;
        ::close(fd);
        continue;
      }
      int soerr = 0;
      socklen_t slen = sizeof(soerr);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &slen) != 0) soerr = errno;
      if (soerr != 0) {
        err = std::string("connect: ") + std::strerror(soerr);
        ::close(fd);
        continue;
      }
      fd_ = fd;
      return true;
    }
    if (err.empty()) err = "connect: no usable address";
    return false;
  }

  bool Handshake(const Endpoint& ep, SSL_CTX* ctx, Clock::time_point deadline, std::string& err) {
    ssl_ = SSL_new(ctx);
    if (ssl_ == nullptr) { err = "tls: " + LastSslError(); return false; }
    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, ep.host.c_str());
    if (ep.verify_tls) SSL_set1_host(ssl_, ep.host.c_str());
    for (;;) {
      const int rc = SSL_connect(ssl_);
      if (rc == 1) return true;
      const short ev = WantedEvents(SSL_get_error(ssl_, rc));
      if (ev == 0) { err = "tls handshake: " + LastSslError(); return false; }
      if (!WaitFd(fd_, ev, deadline, err)) { err = "tls handshake: " + err; return false; }
    }
  }

  void Close() {
    if (ssl_ != nullptr) { SSL_free(ssl_); ssl_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  int  fd_ = -1;
  SSL* ssl_ = nullptr;
};

std::size_t HeaderEnd(std::string_view raw, std::size_t& sep_len) {
  auto pos = raw.find("\r\n\r\n");
  sep_len = 4;
  if (pos == std::string_view::npos) {
    pos = raw.find("\n\n");
    sep_len = 2;
  }
  return pos;
}

// True once the bytes read so far hold a whole response, so we need not wait for EOF.
// Follows the chunk framing; true once the last chunk and its trailer section
// have arrived. A size line that does not parse also ends the read so that
// Dechunk can report it.
bool ChunksComplete(std::string_view body) {
  std::size_t pos = 0;
  for (;;) {
    const auto eol = body.find("\r\n", pos);
    if (eol == std::string_view::npos) return false;
    auto size_sv = body.substr(pos, eol - pos);
    if (auto semi = size_sv.find(';'); semi != std::string_view::npos) size_sv = size_sv.substr(0, semi);
    size_sv = TrimView(size_sv);
    std::size_t chunk = 0;
    auto [ptr, ec] = std::from_chars(size_sv.data(), size_sv.data() + size_sv.size(), chunk, 16);
    if (ec != std::errc{} || ptr != size_sv.data() + size_sv.size()) return true;
    if (chunk == 0) return body.find("\r\n\r\n", eol) != std::string_view::npos;
    pos = eol + 2 + chunk + 2;
    if (pos > body.size()) return false;
  }
}

bool Dechunk(std::string_view body, std::string& out, std::string& err) {
  out.clear();
  std::size_t pos = 0;
  for (;;) {
    const auto eol = body.find("\r\n", pos);
    if (eol == std::string_view::npos) { err = "truncated chunk header"; return false; }
    auto size_sv = body.substr(pos, eol - pos);
    if (auto semi = size_sv.find(';'); semi != std::string_view::npos) size_sv = size_sv.substr(0, semi);
    size_sv = TrimView(size_sv);
    std::size_t chunk = 0;
    auto [ptr, ec] = std::from_chars(size_sv.data(), size_sv.data() + size_sv.size(), chunk, 16);
    if (ec != std::errc{} || ptr != size_sv.data() + size_sv.size()) {
      err = "invalid chunk size";
      return false;
    }
    pos = eol + 2;
    if (chunk == 0) return true;
    if (pos + chunk > body.size()) { err = "truncated chunk"; return false; }
    out.append(body.substr(pos, chunk));
    pos += chunk + 2;
  }
}

} // namespace

bool ResponseComplete(std::string_view raw) {
  std::size_t sep = 0;
  const auto hdr_end = HeaderEnd(raw, sep);
  if (hdr_end == std::string_view::npos) return false;
  const std::string head = Lower(raw.substr(0, hdr_end));
  const auto body = raw.substr(hdr_end + sep);
  if (head.find("transfer-encoding: chunked") != std::string::npos) return ChunksComplete(body);
  const auto cl = head.find("content-length:");
  if (cl == std::string::npos) return false;
  auto value = TrimView(std::string_view(head).substr(cl + 15, head.find('\n', cl) - cl - 15));
  std::size_t len = 0;
  if (std::from_chars(value.data(), value.data() + value.size(), len).ec != std::errc{}) return false;
  return body.size() >= len;
}

bool ParseHttpResponse(std::string_view raw, HttpResponse& out, std::string& err) {
  std::size_t sep = 0;
  const auto hdr_end = HeaderEnd(raw, sep);
  if (hdr_end == std::string_view::npos) {
    err = "truncated response headers";
    return false;
  }
  const auto head = raw.substr(0, hdr_end);
  auto line_end = head.find('\n');
  const auto status_line = TrimView(head.substr(0, line_end));
  if (!status_line.starts_with("HTTP/")) {
    err = "not an HTTP response";
    return false;
  }
  const auto sp = status_line.find(' ');
  if (sp == std::string_view::npos) {
    err = "malformed status line";
    return false;
  }
  const auto code = status_line.substr(sp + 1, 3);
  int status = 0;
  if (std::from_chars(code.data(), code.data() + code.size(), status).ec != std::errc{} || status < 100) {
    err = "malformed status code";
    return false;
  }

  out = HttpResponse{};
  out.status = status;
  while (line_end != std::string_view::npos) {
    const auto start = line_end + 1;
    line_end = head.find('\n', start);
    const auto line = head.substr(start, line_end == std::string_view::npos ? std::string_view::npos : line_end - start);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    out.headers[Lower(TrimView(line.substr(0, colon)))] = std::string(TrimView(line.substr(colon + 1)));
  }

  const auto body = raw.substr(hdr_end + sep);
  if (auto te = out.headers.find("transfer-encoding");
      te != out.headers.end() && Lower(te->second).find("chunked") != std::string::npos) {
    return Dechunk(body, out.body, err);
  }
  if (auto cl = out.headers.find("content-length"); cl != out.headers.end()) {
    std::size_t len = 0;
    const auto& v = cl->second;
    if (std::from_chars(v.data(), v.data() + v.size(), len).ec != std::errc{}) {
      err = "invalid content-length";
      return false;
    }
    if (body.size() < len) {
      err = "truncated body";
      return false;
    }
    out.body.assign(body.substr(0, len));
    return true;
  }
  out.body.assign(body);
  return true;
}

SocketTransport::SocketTransport(Endpoint ep) : ep_(std::move(ep)) {
  if (ep_.scheme != "https") return;
  tls_ = std::make_unique<TlsState>();
  tls_->ctx.reset(SSL_CTX_new(TLS_client_method()));
  if (!tls_->ctx) return;
  if (ep_.verify_tls) {
    SSL_CTX_set_verify(tls_->ctx.get(), SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(tls_->ctx.get());
  } else {
    SSL_CTX_set_verify(tls_->ctx.get(), SSL_VERIFY_NONE, nullptr);
  }
}

SocketTransport::~SocketTransport() = default;

bool SocketTransport::Send(const HttpRequest& req, HttpResponse& resp, std::string& err) {
  const std::string where = ep_.host + ":" + std::to_string(ep_.port);
  if (tls_ && !tls_->ctx) {
    err = where + ": TLS context unavailable";
    return false;
  }

  Connection conn;
  if (!conn.Open(ep_, tls_ ? tls_->ctx.get() : nullptr, Clock::now() + ep_.connect_timeout, err)) {
    err = where + ": " + err;
    return false;
  }

  const auto deadline = Clock::now() + req.timeout;
  const bool default_port = (ep_.scheme == "https" && ep_.port == 443) || (ep_.scheme != "https" && ep_.port == 80);
  std::string wire;
  wire.reserve(256 + req.body.size());
  wire += req.method + " " + req.path + " HTTP/1.1\r\n";
  wire += "Host: " + (default_port ? ep_.host : where) + "\r\n";
  wire += "User-Agent: tomexp\r\nAccept: */*\r\nConnection: close\r\n";
  for (const auto& [k, v] : req.headers) wire += k + ": " + v + "\r\n";
  if (!req.body.empty() || req.method == "POST") wire += "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
  wire += "\r\n";
  wire += req.body;

  if (!conn.WriteAll(wire, deadline, err)) {
    err = where + ": " + err;
    return false;
  }

  std::string raw;
  char buf[4096];
  for (;;) {
    const long n = conn.ReadSome(buf, sizeof(buf), deadline, err);
    if (n < 0) {
      err = where + ": " + err;
      return false;
    }
    if (n == 0) break;
    raw.append(buf, static_cast<std::size_t>(n));
    if (raw.size() > kMaxResponseBytes) {
      err = where + ": response too large";
      return false;
    }
    if (ResponseComplete(raw)) break;
  }
  if (raw.empty()) {
    err = where + ": connection closed without response";
    return false;
  }
  if (!ParseHttpResponse(raw, resp, err)) {
    err = where + ": " + err;
    return false;
  }
  return true;
}

std::string Base64Encode(std::string_view in) {
  static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((in.size() + 2) / 3 * 4);
  std::size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    const unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i + 1]) << 8) |
                       static_cast<unsigned char>(in[i + 2]);
    out += kAlphabet[(v >> 18) & 0x3F];
    out += kAlphabet[(v >> 12) & 0x3F];
    out += kAlphabet[(v >> 6) & 0x3F];
    out += kAlphabet[v & 0x3F];
  }
  if (const auto rest = in.size() - i; rest > 0) {
    unsigned v = static_cast<unsigned char>(in[i]) << 16;
    if (rest == 2) v |= static_cast<unsigned char>(in[i + 1]) << 8;
    out += kAlphabet[(v >> 18) & 0x3F];
    out += kAlphabet[(v >> 12) & 0x3F];
    out += rest == 2 ? kAlphabet[(v >> 6) & 0x3F] : '=';
    out += '=';
  }
  return out;
}

std::string BasicAuthorization(const std::string& user, const std::string& pass) {
  return "Basic " + Base64Encode(user + ":" + pass);
}

std::string FormUrlEncode(const std::vector<std::pair<std::string, std::string>>& fields) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  auto encode = [](std::string& out, const std::string& s) {
    for (const unsigned char c : s) {
      if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '*') {
        out += static_cast<char>(c);
      } else if (c == ' ') {
        out += '+';
      } else {
        out += '%';
        out += kHex[c >> 4];
        out += kHex[c & 0x0F];
      }
    }
  };
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) out += '&';
    encode(out, fields[i].first);
    out += '=';
    encode(out, fields[i].second);
  }
  return out;
}

} // namespace tomexp::router

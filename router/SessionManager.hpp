// Login against the router web UI and ownership of the resulting session token
#pragma once

#include "core/Types.hpp"
#include "router/HttpClient.hpp"

#include <chrono>
#include <memory>
#include <regex>
#include <string>

namespace tomexp::router {

enum class SessionState { Unauthenticated, Valid, Expired };

struct Session {
  SessionState state = SessionState::Unauthenticated;
  std::string  token;
  std::chrono::system_clock::time_point issued_at{};
  int generation = 0;  // bumped on every successful login
};

// Pulls the session token out of an authenticated page. Firmware-dependent, hence pluggable.
class TokenExtractor {
 public:
  virtual ~TokenExtractor() = default;
  // Returns false when the body carries no token.
  virtual bool Extract(const std::string& body, std::string& token) const = 0;
};

class RegexTokenExtractor : public TokenExtractor {
 public:
  // Matches nvram dumps like  'http_id': 'TID4bad0f0eba40bd0c'
  static constexpr const char* kDefaultPattern = R"(http_id['"]?\s*[:=]\s*['"]([A-Za-z0-9_]+)['"])";

  explicit RegexTokenExtractor(const std::string& pattern = kDefaultPattern);
  bool Extract(const std::string& body, std::string& token) const override;

 private:
  std::regex re_;
};

// Token configured by the operator; the login page is still fetched to validate credentials.
class FixedTokenExtractor : public TokenExtractor {
 public:
  explicit FixedTokenExtractor(std::string token) : token_(std::move(token)) {}
  bool Extract(const std::string&, std::string& token) const override {
    token = token_;
    return !token.empty();
  }

 private:
  std::string token_;
};

// Picks the extractor a target's configuration asks for.
std::shared_ptr<const TokenExtractor> MakeTokenExtractor(const Target& target);

struct AuthOutcome {
  ErrorKind   error = ErrorKind::None;
  std::string message;
  bool ok() const { return error == ErrorKind::None; }
};

// One instance per target per scrape cycle; never shared between cycles.
class SessionManager {
 public:
  SessionManager(const Target& target, Transport& transport, std::shared_ptr<const TokenExtractor> extractor);

  // Valid session on success; logs in when Unauthenticated or Expired.
  // A failed login is terminal for the cycle: later calls return the same error without retrying.
  AuthOutcome EnsureSession();

  // Called when a command came back unauthorized on the current session.
  void MarkExpired();

  const Session& session() const { return session_; }
  const std::string& authorization() const { return authorization_; }
  int login_attempts() const { return login_attempts_; }

 private:
  AuthOutcome Login();

  const Target& target_;
  Transport& transport_;
  std::shared_ptr<const TokenExtractor> extractor_;
  std::string authorization_;
  Session session_;
  AuthOutcome failed_;
  int login_attempts_ = 0;
};

} // namespace tomexp::router

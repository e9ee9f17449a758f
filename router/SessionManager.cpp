#include "router/SessionManager.hpp"

#include "core/Log.hpp"

namespace tomexp::router {

RegexTokenExtractor::RegexTokenExtractor(const std::string& pattern) : re_(pattern) {}

bool RegexTokenExtractor::Extract(const std::string& body, std::string& token) const {
  std::smatch m;
  if (!std::regex_search(body, m, re_) || m.size() < 2 || m[1].length() == 0) return false;
  token = m[1].str();
  return true;
}

std::shared_ptr<const TokenExtractor> MakeTokenExtractor(const Target& target) {
  if (!target.http_id.empty()) return std::make_shared<FixedTokenExtractor>(target.http_id);
  if (!target.token_pattern.empty()) return std::make_shared<RegexTokenExtractor>(target.token_pattern);
  return std::make_shared<RegexTokenExtractor>();
}

SessionManager::SessionManager(const Target& target, Transport& transport,
                               std::shared_ptr<const TokenExtractor> extractor)
    : target_(target),
      transport_(transport),
      extractor_(std::move(extractor)),
      authorization_(BasicAuthorization(target.username, target.password)) {}

AuthOutcome SessionManager::EnsureSession() {
  if (!failed_.ok()) return failed_;
  if (session_.state == SessionState::Valid) return {};
  auto outcome = Login();
  if (!outcome.ok()) failed_ = outcome;
  return outcome;
}

void SessionManager::MarkExpired() {
  if (session_.state != SessionState::Valid) return;
  session_.state = SessionState::Expired;
  Log()->debug("target {}: session expired, will re-authenticate", target_.name);
}

AuthOutcome SessionManager::Login() {
  ++login_attempts_;
  HttpRequest req;
  req.method = "GET";
  req.path = target_.auth_path.empty() ? "/" : target_.auth_path;
  req.headers.emplace_back("Authorization", authorization_);
  req.timeout = target_.timeouts.auth;

  HttpResponse resp;
  std::string err;
  if (!transport_.Send(req, resp, err)) {
    Log()->warn("target {}: login failed: {}", target_.name, err);
    return {ErrorKind::Transport, err};
  }
  if (resp.status < 200 || resp.status >= 300) {
    auto msg = "login rejected with HTTP " + std::to_string(resp.status);
    Log()->warn("target {}: {}", target_.name, msg);
    return {ErrorKind::AuthRejected, std::move(msg)};
  }

  std::string token;
  if (!extractor_ || !extractor_->Extract(resp.body, token)) {
    Log()->warn("target {}: no session token in {} ({} bytes)", target_.name, req.path, resp.body.size());
    return {ErrorKind::MalformedAuthResponse, "no session token found in " + req.path};
  }

  session_.token = std::move(token);
  session_.state = SessionState::Valid;
  session_.issued_at = std::chrono::system_clock::now();
  ++session_.generation;
  Log()->debug("target {}: authenticated (generation {})", target_.name, session_.generation);
  return {};
}

} // namespace tomexp::router

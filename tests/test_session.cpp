#include "router/SessionManager.hpp"

#include "FakeRouter.hpp"

#include <gtest/gtest.h>

using namespace tomexp;
using namespace tomexp::router;

namespace {

Target MakeTarget() {
  Target t;
  t.name = "karabor";
  t.host = "192.168.1.1";
  t.username = "admin";
  t.password = "secret";
  return t;
}

} // namespace

TEST(TokenExtractor, DefaultPatternFindsNvramToken) {
  RegexTokenExtractor ex;
  std::string token;
  EXPECT_TRUE(ex.Extract("nvram = {\n'http_id': 'TID4bad0f0eba40bd0c',\n}", token));
  EXPECT_EQ(token, "TID4bad0f0eba40bd0c");
  EXPECT_TRUE(ex.Extract("<input type='hidden' name='_http_id' value='x'> var http_id = \"TIDabc\";", token));
  EXPECT_EQ(token, "TIDabc");
  EXPECT_FALSE(ex.Extract("<html>no token here</html>", token));
}

TEST(TokenExtractor, ConfiguredStrategies) {
  auto t = MakeTarget();
  std::string token;

  t.http_id = "TIDfixed";
  EXPECT_TRUE(MakeTokenExtractor(t)->Extract("", token));
  EXPECT_EQ(token, "TIDfixed");

  t.http_id.clear();
  t.token_pattern = R"(session=([0-9a-f]+))";
  EXPECT_TRUE(MakeTokenExtractor(t)->Extract("a session=00ff b", token));
  EXPECT_EQ(token, "00ff");
}

TEST(SessionManager, LoginSendsBasicAuthAndStoresToken) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  SessionManager sm(target, router, MakeTokenExtractor(target));
  EXPECT_EQ(sm.session().state, SessionState::Unauthenticated);

  auto outcome = sm.EnsureSession();
  ASSERT_TRUE(outcome.ok()) << outcome.message;
  EXPECT_EQ(sm.session().state, SessionState::Valid);
  EXPECT_EQ(sm.session().token, "TID4bad0f0eba40bd0c");
  EXPECT_EQ(sm.session().generation, 1);

  ASSERT_EQ(router.requests.size(), 1u);
  const auto& req = router.requests.front();
  EXPECT_EQ(req.method, "GET");
  EXPECT_EQ(req.path, "/");
  EXPECT_EQ(req.timeout, target.timeouts.auth);
  ASSERT_FALSE(req.headers.empty());
  EXPECT_EQ(req.headers.front().first, "Authorization");
  EXPECT_EQ(req.headers.front().second, BasicAuthorization("admin", "secret"));

  // Valid session is reused
  EXPECT_TRUE(sm.EnsureSession().ok());
  EXPECT_EQ(router.logins, 1);
}

TEST(SessionManager, RejectedCredentials) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  router.login_status = 401;
  SessionManager sm(target, router, MakeTokenExtractor(target));

  auto outcome = sm.EnsureSession();
  EXPECT_EQ(outcome.error, ErrorKind::AuthRejected);
  EXPECT_EQ(sm.session().state, SessionState::Unauthenticated);

  // Terminal for the cycle: no second login
  EXPECT_EQ(sm.EnsureSession().error, ErrorKind::AuthRejected);
  EXPECT_EQ(router.logins, 1);
}

TEST(SessionManager, MissingTokenIsMalformedNotRejected) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  router.login_body = "<html><title>Tomato</title>welcome</html>";
  SessionManager sm(target, router, MakeTokenExtractor(target));
  EXPECT_EQ(sm.EnsureSession().error, ErrorKind::MalformedAuthResponse);
}

TEST(SessionManager, TransportFailureDuringLogin) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  router.login_fails = true;
  SessionManager sm(target, router, MakeTokenExtractor(target));
  auto outcome = sm.EnsureSession();
  EXPECT_EQ(outcome.error, ErrorKind::Transport);
  EXPECT_NE(outcome.message.find("timed out"), std::string::npos);
}

TEST(SessionManager, ExpiredSessionLogsInAgain) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  router.rotate_token = true;
  SessionManager sm(target, router, MakeTokenExtractor(target));

  ASSERT_TRUE(sm.EnsureSession().ok());
  const auto first = sm.session().token;
  sm.MarkExpired();
  EXPECT_EQ(sm.session().state, SessionState::Expired);

  ASSERT_TRUE(sm.EnsureSession().ok());
  EXPECT_EQ(sm.session().state, SessionState::Valid);
  EXPECT_NE(sm.session().token, first);
  EXPECT_EQ(sm.session().generation, 2);
  EXPECT_EQ(sm.login_attempts(), 2);
}

TEST(SessionManager, MarkExpiredIgnoredWithoutSession) {
  auto target = MakeTarget();
  fakes::FakeRouter router;
  SessionManager sm(target, router, MakeTokenExtractor(target));
  sm.MarkExpired();
  EXPECT_EQ(sm.session().state, SessionState::Unauthenticated);
}

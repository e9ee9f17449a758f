#include "router/CommandExecutor.hpp"

#include "FakeRouter.hpp"

#include <gtest/gtest.h>

using namespace tomexp;
using namespace tomexp::router;

namespace {

Session ValidSession(const std::string& token = "TID4bad0f0eba40bd0c") {
  Session s;
  s.state = SessionState::Valid;
  s.token = token;
  s.generation = 1;
  return s;
}

const CommandSpec kLoadavg{"loadavg", "cat /proc/loadavg", nullptr};

class ExecutorTest : public ::testing::Test {
 protected:
  Target target_;
  fakes::FakeRouter router_;

  void SetUp() override {
    target_.name = "karabor";
    target_.host = "192.168.1.1";
    target_.username = "admin";
    target_.password = "secret";
  }
};

} // namespace

TEST(OutputStripper, PreBlockWithEntities) {
  ConsoleOutputStripper s;
  EXPECT_EQ(s.Strip("<html><PRE class=\"x\">a &lt;b&gt; &amp; &#65;&#x42;\n</PRE></html>"), "a <b> & AB\n");
}

TEST(OutputStripper, JavascriptResult) {
  ConsoleOutputStripper s;
  EXPECT_EQ(s.Strip("<script>\ncmdresult = 'line1\\nit\\'s \\x41\\u0042';\n</script>"), "line1\nit's AB");
}

TEST(OutputStripper, UnwrappedBodyIsKept) {
  ConsoleOutputStripper s;
  EXPECT_EQ(s.Strip("0.08 0.03 0.01 1/42 1234\n"), "0.08 0.03 0.01 1/42 1234\n");
}

TEST_F(ExecutorTest, PostsConsoleForm) {
  router_.outputs["cat /proc/loadavg"] = "0.08 0.03 0.01 1/42 1234\n";
  CommandExecutor ex(target_, router_);

  auto out = ex.Run(ValidSession(), kLoadavg);
  ASSERT_TRUE(out.ok()) << out.message;
  EXPECT_EQ(out.output.collector, "loadavg");
  EXPECT_EQ(out.output.text, "0.08 0.03 0.01 1/42 1234\n");
  EXPECT_NE(out.output.executed_at.time_since_epoch().count(), 0);

  ASSERT_EQ(router_.requests.size(), 1u);
  const auto& req = router_.requests.front();
  EXPECT_EQ(req.method, "POST");
  EXPECT_EQ(req.path, "/shell.cgi");
  EXPECT_EQ(req.timeout, target_.timeouts.command);
  const auto form = fakes::FormFields(req.body);
  EXPECT_EQ(form.at("_http_id"), "TID4bad0f0eba40bd0c");
  EXPECT_EQ(form.at("action"), "execute");
  EXPECT_EQ(form.at("nojs"), "1");
  EXPECT_EQ(form.at("working_dir"), "/www");
  EXPECT_EQ(form.at("command"), "cat /proc/loadavg");

  bool has_auth = false;
  for (const auto& [k, v] : req.headers) has_auth |= (k == "Authorization" && v == BasicAuthorization("admin", "secret"));
  EXPECT_TRUE(has_auth);
}

TEST_F(ExecutorTest, RefusesWithoutValidSession) {
  CommandExecutor ex(target_, router_);
  Session s = ValidSession();
  s.state = SessionState::Expired;
  EXPECT_EQ(ex.Run(s, kLoadavg).error, ErrorKind::Unauthorized);
  EXPECT_TRUE(router_.requests.empty());
}

TEST_F(ExecutorTest, RejectedSessionIsUnauthorized) {
  CommandExecutor ex(target_, router_);
  router_.unauthorized_next = 1;
  EXPECT_EQ(ex.Run(ValidSession(), kLoadavg).error, ErrorKind::Unauthorized);
  // Stale token: firmware answers 200 with its invalid-session page
  EXPECT_EQ(ex.Run(ValidSession("TIDstale"), kLoadavg).error, ErrorKind::Unauthorized);
}

TEST_F(ExecutorTest, TimeoutIsTransport) {
  CommandExecutor ex(target_, router_);
  router_.hang.insert("cat /proc/loadavg");
  auto out = ex.Run(ValidSession(), kLoadavg);
  EXPECT_EQ(out.error, ErrorKind::Transport);
  EXPECT_NE(out.message.find("timed out"), std::string::npos);
}

TEST_F(ExecutorTest, BlankOutputIsEmptyOutput) {
  CommandExecutor ex(target_, router_);
  router_.outputs["cat /proc/loadavg"] = " \n\n";
  EXPECT_EQ(ex.Run(ValidSession(), kLoadavg).error, ErrorKind::EmptyOutput);
}

TEST_F(ExecutorTest, CustomStripper) {
  struct Upper : OutputStripper {
    std::string Strip(const std::string&) const override { return "stripped"; }
  };
  router_.outputs["cat /proc/loadavg"] = "x";
  CommandExecutor ex(target_, router_, std::make_shared<Upper>());
  EXPECT_EQ(ex.Run(ValidSession(), kLoadavg).output.text, "stripped");
}

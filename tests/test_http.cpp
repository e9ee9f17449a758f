#include "router/HttpClient.hpp"

#include <gtest/gtest.h>

using namespace tomexp::router;

TEST(HttpHelpers, Base64) {
  EXPECT_EQ(Base64Encode(""), "");
  EXPECT_EQ(Base64Encode("f"), "Zg==");
  EXPECT_EQ(Base64Encode("fo"), "Zm8=");
  EXPECT_EQ(Base64Encode("foo"), "Zm9v");
  EXPECT_EQ(Base64Encode("user:pass"), "dXNlcjpwYXNz");
}

TEST(HttpHelpers, BasicAuthorization) {
  EXPECT_EQ(BasicAuthorization("admin", "admin"), "Basic YWRtaW46YWRtaW4=");
}

TEST(HttpHelpers, FormUrlEncodeConsoleRequest) {
  const auto body = FormUrlEncode({{"_http_id", "TID4bad0f0eba40bd0c"},
                                   {"action", "execute"},
                                   {"working_dir", "/www"},
                                   {"command", "date +%s; cat /proc/uptime"}});
  EXPECT_EQ(body,
            "_http_id=TID4bad0f0eba40bd0c&action=execute&working_dir=%2Fwww"
            "&command=date+%2B%25s%3B+cat+%2Fproc%2Fuptime");
}

TEST(HttpResponseParser, ContentLength) {
  HttpResponse r;
  std::string err;
  ASSERT_TRUE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nContent-Length: 5\r\n\r\nhello", r, err))
      << err;
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.headers["content-type"], "text/html");
  EXPECT_EQ(r.body, "hello");
}

TEST(HttpResponseParser, Chunked) {
  HttpResponse r;
  std::string err;
  ASSERT_TRUE(ParseHttpResponse(
                  "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n", r,
                  err))
      << err;
  EXPECT_EQ(r.body, "Wikipedia");
}

TEST(HttpResponseParser, CloseDelimitedHttp10) {
  HttpResponse r;
  std::string err;
  ASSERT_TRUE(ParseHttpResponse("HTTP/1.0 401 Unauthorized\r\nWWW-Authenticate: Basic realm=\"x\"\r\n\r\nnope", r, err));
  EXPECT_EQ(r.status, 401);
  EXPECT_EQ(r.headers["www-authenticate"], "Basic realm=\"x\"");
  EXPECT_EQ(r.body, "nope");
}

TEST(HttpResponseParser, RejectsTruncatedAndGarbage) {
  HttpResponse r;
  std::string err;
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort", r, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nA\r\nabc", r, err));
  EXPECT_FALSE(ParseHttpResponse("SSH-2.0-dropbear\r\n\r\n", r, err));
  EXPECT_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n", r, err));
}

TEST(HttpResponseParser, ChunkedCompletionFollowsFraming) {
  const std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
  // Payload "ab0\r\n" plus its CRLF ends in the same bytes as a last-chunk.
  const std::string partial = head + "5\r\nab0\r\n\r\n";
  EXPECT_FALSE(ResponseComplete(partial));

  const std::string full = partial + "0\r\n\r\n";
  EXPECT_TRUE(ResponseComplete(full));
  HttpResponse r;
  std::string err;
  ASSERT_TRUE(ParseHttpResponse(full, r, err)) << err;
  EXPECT_EQ(r.body, "ab0\r\n");

  EXPECT_FALSE(ResponseComplete(head + "4\r\nWiki\r\n0\r\n"));
  EXPECT_TRUE(ResponseComplete(head + "4\r\nWiki\r\n0\r\nX-Trailer: 1\r\n\r\n"));
  EXPECT_TRUE(ResponseComplete(head + "0\r\n\r\n"));
}

TEST(HttpResponseParser, ContentLengthCompletion) {
  EXPECT_FALSE(ResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel"));
  EXPECT_TRUE(ResponseComplete("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello"));
  EXPECT_FALSE(ResponseComplete("HTTP/1.0 200 OK\r\n\r\nuntil close"));
}

TEST(SocketTransport, ConnectFailureIsReportedNotThrown) {
  Endpoint ep;
  ep.host = "127.0.0.1";
  ep.port = 1;  // nothing listens here
  ep.connect_timeout = std::chrono::milliseconds(500);
  SocketTransport t(ep);
  HttpRequest req;
  req.timeout = std::chrono::milliseconds(500);
  HttpResponse resp;
  std::string err;
  EXPECT_FALSE(t.Send(req, resp, err));
  EXPECT_NE(err.find("127.0.0.1:1"), std::string::npos);
}

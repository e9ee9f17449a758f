#include "router/CommandExecutor.hpp"

#include "core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string_view>

namespace tomexp::router {

namespace {

std::string Lower(std::string_view sv) {
  std::string out(sv);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool IsBlank(std::string_view sv) {
  return sv.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

void AppendUtf8(std::string& out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x110000) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

bool ParseHex(std::string_view sv, unsigned long& out) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out, 16);
  return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// Finds `cmdresult = '...'` and returns the raw (still escaped) literal.
bool FindJsResult(const std::string& body, std::string& literal) {
  auto pos = body.find("cmdresult");
  if (pos == std::string::npos) return false;
  pos = body.find_first_not_of(" \t", pos + 9);
  if (pos == std::string::npos || body[pos] != '=') return false;
  pos = body.find_first_not_of(" \t", pos + 1);
  if (pos == std::string::npos || (body[pos] != '\'' && body[pos] != '"')) return false;
  const char quote = body[pos];
  const auto start = ++pos;
  for (; pos < body.size(); ++pos) {
    if (body[pos] == '\\') { ++pos; continue; }
    if (body[pos] == quote) {
      literal = body.substr(start, pos - start);
      return true;
    }
  }
  return false;
}

// The console answers a stale _http_id with a short error page instead of output.
bool LooksLikeSessionError(const std::string& body) {
  if (body.size() > 2048) return false;
  const auto lower = Lower(body);
  const auto first = lower.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return false;
  const std::string_view head(lower.data() + first, lower.size() - first);
  if (head.starts_with("invalid session id") || head.starts_with("unauthorized")) return true;
  const auto t = lower.find("<title>");
  if (t == std::string::npos) return false;
  const auto te = lower.find("</title>", t);
  const auto title = std::string_view(lower).substr(t, te == std::string::npos ? std::string::npos : te - t);
  return title.find("unauthorized") != std::string_view::npos || title.find("invalid session") != std::string_view::npos;
}

} // namespace

std::string DecodeHtmlEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '&') { out += in[i]; continue; }
    const auto semi = in.find(';', i);
    if (semi == std::string::npos || semi - i > 10) { out += in[i]; continue; }
    const std::string_view ent(in.data() + i + 1, semi - i - 1);
    unsigned long cp = 0;
    if (ent == "lt") out += '<';
    else if (ent == "gt") out += '>';
    else if (ent == "amp") out += '&';
    else if (ent == "quot") out += '"';
    else if (ent == "apos") out += '\'';
    else if (ent == "nbsp") out += ' ';
    else if (ent.size() > 2 && (ent[1] == 'x' || ent[1] == 'X') && ent[0] == '#' && ParseHex(ent.substr(2), cp)) AppendUtf8(out, cp);
    else if (ent.size() > 1 && ent[0] == '#' &&
             std::from_chars(ent.data() + 1, ent.data() + ent.size(), cp).ec == std::errc{}) AppendUtf8(out, cp);
    else { out += in[i]; continue; }
    i = semi;
  }
  return out;
}

std::string DecodeJsString(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] != '\\' || i + 1 == in.size()) { out += in[i]; continue; }
    const char c = in[++i];
    unsigned long cp = 0;
    switch (c) {
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 't': out += '\t'; break;
      case '0': out += '\0'; break;
      case 'x':
        if (i + 2 < in.size() && ParseHex(std::string_view(in).substr(i + 1, 2), cp)) {
          AppendUtf8(out, cp);
          i += 2;
        } else {
          out += c;
        }
        break;
      case 'u':
        if (i + 4 < in.size() && ParseHex(std::string_view(in).substr(i + 1, 4), cp)) {
          AppendUtf8(out, cp);
          i += 4;
        } else {
          out += c;
        }
        break;
      default: out += c; break;  // \\ \' \" \/
    }
  }
  return out;
}

std::string ConsoleOutputStripper::Strip(const std::string& body) const {
  const auto lower = Lower(body);
  if (const auto open = lower.find("<pre"); open != std::string::npos) {
    const auto gt = body.find('>', open);
    const auto close = gt == std::string::npos ? std::string::npos : lower.find("</pre>", gt);
    if (close != std::string::npos) return DecodeHtmlEntities(body.substr(gt + 1, close - gt - 1));
  }
  if (std::string literal; FindJsResult(body, literal)) return DecodeJsString(literal);
  return body;
}

CommandExecutor::CommandExecutor(const Target& target, Transport& transport,
                                 std::shared_ptr<const OutputStripper> stripper)
    : target_(target),
      transport_(transport),
      stripper_(std::move(stripper)),
      authorization_(BasicAuthorization(target.username, target.password)) {}

ExecOutcome CommandExecutor::Run(const Session& session, const CommandSpec& spec) {
  ExecOutcome out;
  out.output.collector = spec.name;
  if (session.state != SessionState::Valid) {
    out.error = ErrorKind::Unauthorized;
    out.message = "no valid session";
    return out;
  }

  HttpRequest req;
  req.method = "POST";
  req.path = kConsolePath;
  req.headers.emplace_back("Authorization", authorization_);
  req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  req.body = FormUrlEncode({
      {"_http_id", session.token},
      {"action", "execute"},
      {"nojs", "1"},
      {"working_dir", "/www"},
      {"command", spec.command},
  });
  req.timeout = target_.timeouts.command;

  HttpResponse resp;
  std::string err;
  if (!transport_.Send(req, resp, err)) {
    out.error = ErrorKind::Transport;
    out.message = std::move(err);
    return out;
  }
  if (resp.status == 401 || resp.status == 403 || LooksLikeSessionError(resp.body)) {
    out.error = ErrorKind::Unauthorized;
    out.message = "console rejected the session (HTTP " + std::to_string(resp.status) + ")";
    return out;
  }
  if (resp.status < 200 || resp.status >= 300) {
    out.error = ErrorKind::Transport;
    out.message = "console returned HTTP " + std::to_string(resp.status);
    return out;
  }

  out.output.text = stripper_ ? stripper_->Strip(resp.body) : resp.body;
  out.output.executed_at = std::chrono::system_clock::now();
  if (IsBlank(out.output.text)) {
    out.error = ErrorKind::EmptyOutput;
    out.message = "command '" + spec.name + "' produced no output";
    return out;
  }
  Log()->trace("target {}: {} returned {} bytes", target_.name, spec.name, out.output.text.size());
  return out;
}

} // namespace tomexp::router

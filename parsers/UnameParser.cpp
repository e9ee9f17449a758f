#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

namespace tomexp::parsers {

namespace {

bool IsYear(std::string_view tok) {
  std::uint64_t v = 0;
  return tok.size() == 4 && ParseU64(tok, v);
}

} // namespace

// `uname -a` prints: sysname nodename release version... machine [processor platform] os.
// The version is free text ending with the build year on every firmware seen; the
// token after the year is the machine.
ParseOutcome ParseUname(const RawOutput& raw) {
  ParseOutcome out;
  std::string_view line;
  for (const auto l : SplitLines(raw.text)) {
    if (!Trim(l).empty()) { line = Trim(l); break; }
  }
  const auto tok = SplitFields(line);
  if (tok.size() < 5) return Failure(raw, "expected at least 5 uname fields", raw.text);

  std::size_t last_version = 0;
  for (std::size_t i = tok.size() - 1; i > 3; --i) {
    if (IsYear(tok[i]) && i + 1 < tok.size()) { last_version = i; break; }
  }
  if (last_version == 0) last_version = tok.size() >= 6 ? tok.size() - 3 : 3;
  const std::size_t machine = last_version + 1;

  const auto vbegin = tok[3].data() - line.data();
  const auto vend = tok[last_version].data() + tok[last_version].size() - line.data();

  out.samples.push_back(Gauge("node_uname_info", 1,
                              {{"domainname", "(none)"},
                               {"machine", std::string(tok[machine])},
                               {"nodename", std::string(tok[1])},
                               {"release", std::string(tok[2])},
                               {"sysname", std::string(tok[0])},
                               {"version", std::string(line.substr(vbegin, vend - vbegin))}},
                              "Labeled system information as provided by the uname system call."));
  return out;
}

} // namespace tomexp::parsers

#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <cmath>

namespace tomexp::parsers {

// Line 1: epoch seconds from `date +%s`. Line 2 (optional): /proc/uptime.
ParseOutcome ParseTime(const RawOutput& raw) {
  ParseOutcome out;
  std::vector<std::string_view> lines;
  for (const auto l : SplitLines(raw.text)) {
    if (!Trim(l).empty()) lines.push_back(Trim(l));
  }
  if (lines.empty()) return Failure(raw, "no output", raw.text);

  std::int64_t now = 0;
  if (!ParseI64(lines[0], now)) return Failure(raw, "expected epoch seconds", lines[0]);
  out.samples.push_back(Gauge("node_time_seconds", static_cast<double>(now), {},
                              "System time in seconds since epoch (1970)."));

  if (lines.size() > 1) {
    const auto fields = SplitFields(lines[1]);
    double uptime = 0;
    if (fields.empty() || !ParseDouble(fields[0], uptime) || uptime < 0) {
      return Failure(raw, "bad /proc/uptime line", lines[1]);
    }
    const auto boot = static_cast<double>(now) - std::floor(uptime);
    out.samples.push_back(Gauge("node_boot_time_seconds", boot, {}, "Node boot time, in unixtime."));
  }
  return out;
}

} // namespace tomexp::parsers

#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

namespace tomexp::parsers {

// "0.08 0.03 0.01 1/42 1234"; the running/total column is optional.
ParseOutcome ParseLoadavg(const RawOutput& raw) {
  ParseOutcome out;
  std::string_view line;
  for (const auto l : SplitLines(raw.text)) {
    if (!Trim(l).empty()) { line = l; break; }
  }
  const auto fields = SplitFields(line);
  if (fields.size() < 3) return Failure(raw, "expected at least 3 load averages", raw.text);

  static constexpr const char* kNames[] = {"node_load1", "node_load5", "node_load15"};
  static constexpr const char* kHelp[] = {"1m load average.", "5m load average.", "15m load average."};
  for (int i = 0; i < 3; ++i) {
    double v = 0;
    if (!ParseDouble(fields[i], v)) return Failure(raw, "non-numeric load average", line);
    out.samples.push_back(Gauge(kNames[i], v, {}, kHelp[i]));
  }

  if (fields.size() > 3) {
    const auto procs = fields[3];
    const auto slash = procs.find('/');
    std::uint64_t total = 0;
    if (slash != std::string_view::npos && ParseU64(procs.substr(slash + 1), total)) {
      out.samples.push_back(Gauge("node_processes_pids", static_cast<double>(total), {}, "Number of PIDs"));
    }
  }
  return out;
}

} // namespace tomexp::parsers

#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <array>

namespace tomexp::parsers {

namespace {

constexpr std::array<const char*, 8> kModes = {
    "user", "nice", "system", "idle", "iowait", "irq", "softirq", "steal"};

constexpr const char* kCpuHelp = "Seconds the CPUs spent in each mode.";

// Single-value lines: name, metric, counter?
struct ScalarLine {
  const char* key;
  const char* metric;
  bool counter;
  const char* help;
};

constexpr std::array<ScalarLine, 5> kScalars = {{
    {"intr", "node_intr_total", true, "Total number of interrupts serviced."},
    {"ctxt", "node_context_switches_total", true, "Total number of context switches."},
    {"processes", "node_forks_total", true, "Total number of forks."},
    {"procs_running", "node_procs_running", false, "Number of processes in runnable state."},
    {"procs_blocked", "node_procs_blocked", false, "Number of processes blocked waiting for I/O to complete."},
}};

} // namespace

ParseOutcome ParseCpuStat(const RawOutput& raw) {
  ParseOutcome out;
  std::vector<MetricSample> scalars;
  int cpus = 0;

  for (const auto line : SplitLines(raw.text)) {
    const auto fields = SplitFields(line);
    if (fields.empty()) continue;
    const auto key = fields[0];

    if (key.starts_with("cpu")) {
      if (key == "cpu") continue;  // aggregate line; node_exporter reports per-cpu only
      const auto id = key.substr(3);
      std::uint64_t n = 0;
      if (!ParseU64(id, n)) return Failure(raw, "bad cpu line", line);
      if (fields.size() < 5) return Failure(raw, "cpu line has fewer than 4 counters", line);
      for (std::size_t i = 0; i < kModes.size() && i + 1 < fields.size(); ++i) {
        std::uint64_t jiffies = 0;
        if (!ParseU64(fields[i + 1], jiffies)) return Failure(raw, "non-numeric cpu counter", line);
        out.samples.push_back(Counter("node_cpu_seconds_total", static_cast<double>(jiffies) / kUserHz,
                                      {{"cpu", std::string(id)}, {"mode", kModes[i]}}, kCpuHelp));
      }
      ++cpus;
      continue;
    }

    for (const auto& s : kScalars) {
      if (key != s.key) continue;
      std::uint64_t v = 0;
      if (fields.size() < 2 || !ParseU64(fields[1], v)) return Failure(raw, std::string("bad ") + s.key + " line", line);
      scalars.push_back(s.counter ? Counter(s.metric, static_cast<double>(v), {}, s.help)
                                  : Gauge(s.metric, static_cast<double>(v), {}, s.help));
    }
    // btime, softirq and unknown lines are ignored
  }

  if (cpus == 0) return Failure(raw, "no per-cpu lines", raw.text);
  out.samples.insert(out.samples.end(), scalars.begin(), scalars.end());
  return out;
}

} // namespace tomexp::parsers

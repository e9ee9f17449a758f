#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

namespace tomexp::parsers {

namespace {

// "Active(anon)" -> "Active_anon", matching node_exporter's metric names.
std::string MetricField(std::string_view key) {
  std::string out;
  out.reserve(key.size() + 1);
  for (const char c : key) {
    if (c == '(') out += '_';
    else if (c == ')') continue;
    else if (c == ' ' || c == '-') out += '_';
    else out += c;
  }
  return out;
}

} // namespace

ParseOutcome ParseMeminfo(const RawOutput& raw) {
  ParseOutcome out;
  for (const auto line : SplitLines(raw.text)) {
    if (Trim(line).empty()) continue;
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return Failure(raw, "expected 'Field: value [kB]'", line);

    const auto field = MetricField(Trim(line.substr(0, colon)));
    const auto rest = SplitFields(line.substr(colon + 1));
    std::uint64_t v = 0;
    if (rest.empty() || !ParseU64(rest[0], v)) return Failure(raw, "non-numeric meminfo value", line);

    if (rest.size() > 1 && (rest[1] == "kB" || rest[1] == "KB")) {
      const auto name = "node_memory_" + field + "_bytes";
      out.samples.push_back(Gauge(name, static_cast<double>(v) * 1024.0, {}, "Memory information field " + field + "_bytes."));
    } else {
      const auto name = "node_memory_" + field;
      out.samples.push_back(Gauge(name, static_cast<double>(v), {}, "Memory information field " + field + "."));
    }
  }
  if (out.samples.empty()) return Failure(raw, "no meminfo fields", raw.text);
  return out;
}

} // namespace tomexp::parsers

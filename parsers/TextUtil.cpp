#include "parsers/TextUtil.hpp"

#include <charconv>

namespace tomexp::parsers {

std::string_view Trim(std::string_view sv) {
  const auto l = sv.find_first_not_of(" \t\r\n");
  if (l == std::string_view::npos) return {};
  const auto r = sv.find_last_not_of(" \t\r\n");
  return sv.substr(l, r - l + 1);
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (end < text.size() || !line.empty()) out.push_back(line);
    start = end + 1;
  }
  return out;
}

std::vector<std::string_view> SplitFields(std::string_view line) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) ++i;
    const auto start = i;
    while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r') ++i;
    if (i > start) out.push_back(line.substr(start, i - start));
  }
  return out;
}

bool ParseU64(std::string_view sv, std::uint64_t& out) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool ParseI64(std::string_view sv, std::int64_t& out) {
  if (sv.empty()) return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool ParseDouble(std::string_view sv, double& out) {
  if (!sv.empty() && sv.back() == '.') sv.remove_suffix(1);
  if (sv.empty()) return false;
  if (sv.front() == '+') sv.remove_prefix(1);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc{} && ptr == sv.data() + sv.size();
}

std::string Snippet(std::string_view text, std::size_t max) {
  std::string out;
  for (const char c : text.substr(0, max)) {
    if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (static_cast<unsigned char>(c) < 0x20) out += '?';
    else out += c;
  }
  if (text.size() > max) out += "...";
  return out;
}

MetricSample Gauge(std::string name, double value, std::vector<Label> labels, std::string help) {
  return MetricSample{std::move(name), MetricKind::Gauge, std::move(labels), value, std::move(help)};
}

MetricSample Counter(std::string name, double value, std::vector<Label> labels, std::string help) {
  return MetricSample{std::move(name), MetricKind::Counter, std::move(labels), value, std::move(help)};
}

ParseOutcome Failure(const RawOutput& raw, std::string message, std::string_view offending) {
  ParseOutcome out;
  out.failed = true;
  out.error.collector = raw.collector;
  out.error.message = std::move(message);
  out.error.snippet = Snippet(offending);
  return out;
}

} // namespace tomexp::parsers

#include "TextParser.hpp"

#include <prometheus/metric_type.h>

#include <cctype>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>
#include <string_view>
#include <unordered_map>

namespace tomexp::exposition {

namespace {

static inline std::string trim(std::string_view sv) {
  auto l = sv.find_first_not_of(" \t\r\n");
  if (l == std::string_view::npos) return {};
  auto r = sv.find_last_not_of(" \t\r\n");
  return std::string(sv.substr(l, r - l + 1));
}

// {k="v",k2="v\"2"}; consumes from sv up to and including the closing brace.
static bool parseLabels(std::string_view& sv, std::vector<prometheus::ClientMetric::Label>& out) {
  out.clear();
  if (sv.empty() || sv.front() != '{') return false;
  sv.remove_prefix(1);
  while (true) {
    auto p = sv.find_first_not_of(" \t,");
    if (p == std::string_view::npos) return false;
    sv.remove_prefix(p);
    if (sv.front() == '}') { sv.remove_prefix(1); return true; }
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) return false;
    auto k = trim(sv.substr(0, eq));
    sv.remove_prefix(eq + 1);
    if (sv.empty() || sv.front() != '"') return false;
    sv.remove_prefix(1);
    std::string v;
    bool closed = false;
    while (!sv.empty()) {
      char c = sv.front();
      sv.remove_prefix(1);
      if (c == '"') { closed = true; break; }
      if (c == '\\' && !sv.empty()) {
        char e = sv.front();
        sv.remove_prefix(1);
        v += (e == 'n') ? '\n' : e;
        continue;
      }
      v += c;
    }
    if (!closed || k.empty()) return false;
    out.push_back({std::move(k), std::move(v)});
  }
}

static bool parseNumber(std::string_view sv, double& out) {
  if (sv == "+Inf" || sv == "Inf") { out = std::numeric_limits<double>::infinity(); return true; }
  if (sv == "-Inf") { out = -std::numeric_limits<double>::infinity(); return true; }
  if (sv == "NaN" || sv == "Nan") { out = std::numeric_limits<double>::quiet_NaN(); return true; }
  std::string s(sv);
  std::istringstream iss(s);
  iss.imbue(std::locale::classic());
  iss >> out;
  return !iss.fail() && iss.eof();
}

static prometheus::MetricType typeFromString(std::string_view s) {
  if (s == "counter") return prometheus::MetricType::Counter;
  if (s == "gauge") return prometheus::MetricType::Gauge;
  if (s == "summary") return prometheus::MetricType::Summary;
  if (s == "histogram") return prometheus::MetricType::Histogram;
  return prometheus::MetricType::Untyped;
}

} // namespace

double SampleValue(const prometheus::MetricFamily& family, const prometheus::ClientMetric& metric) {
  switch (family.type) {
    case prometheus::MetricType::Counter: return metric.counter.value;
    case prometheus::MetricType::Gauge: return metric.gauge.value;
    default: return metric.untyped.value;
  }
}

bool ParseTextExposition(const std::string& text, std::vector<prometheus::MetricFamily>& fams, std::string& err) {
  fams.clear();
  std::istringstream iss(text);
  std::string line;
  std::unordered_map<std::string, prometheus::MetricType> ty_map;
  std::unordered_map<std::string, std::string> help_map;
  auto getFam = [&](const std::string& name) -> prometheus::MetricFamily& {
    for (auto& f : fams) if (f.name == name) return f;
    fams.push_back({});
    auto& f = fams.back();
    f.name = name;
    auto ty = ty_map.find(name);
    f.type = ty == ty_map.end() ? prometheus::MetricType::Untyped : ty->second;
    auto hlp = help_map.find(name);
    if (hlp != help_map.end()) f.help = hlp->second;
    return f;
  };

  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    if (line[0] == '#') {
      std::istringstream cs(line.substr(1));
      std::string kw, name;
      cs >> kw >> name;
      std::string rest;
      std::getline(cs, rest);
      if (kw == "TYPE") ty_map[name] = typeFromString(trim(rest));
      else if (kw == "HELP") help_map[name] = trim(rest);
      continue;
    }

    // name[labels] value [timestamp]
    std::string_view sv(line);
    size_t i = 0;
    while (i < sv.size() && (std::isalnum((unsigned char)sv[i]) || sv[i]=='_' || sv[i]==':')) ++i;
    std::string name(sv.substr(0, i));
    sv.remove_prefix(i);
    if (name.empty()) { err = "line " + std::to_string(lineno) + ": missing metric name"; return false; }

    std::vector<prometheus::ClientMetric::Label> labels;
    if (!sv.empty() && sv.front() == '{' && !parseLabels(sv, labels)) {
      err = "line " + std::to_string(lineno) + ": bad label set";
      return false;
    }
    auto p = sv.find_first_not_of(" \t");
    if (p == std::string_view::npos) { err = "line " + std::to_string(lineno) + ": missing value"; return false; }
    sv.remove_prefix(p);
    auto q = sv.find_first_of(" \t");
    double value = 0;
    if (!parseNumber(sv.substr(0, q), value)) {
      err = "line " + std::to_string(lineno) + ": bad value";
      return false;
    }

    auto& f = getFam(name);
    prometheus::ClientMetric m;
    m.label = std::move(labels);
    switch (f.type) {
      case prometheus::MetricType::Counter: m.counter.value = value; break;
      case prometheus::MetricType::Gauge: m.gauge.value = value; break;
      default: m.untyped.value = value; break;
    }
    f.metric.push_back(std::move(m));
  }
  return true;
}

} // namespace tomexp::exposition

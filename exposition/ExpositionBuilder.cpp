#include "exposition/ExpositionBuilder.hpp"

#include "core/Log.hpp"

#include <prometheus/metric_type.h>
#include <prometheus/text_serializer.h>

#include <algorithm>
#include <sstream>

namespace tomexp::exposition {

namespace {

constexpr const char* kLivenessHelp = "Whether the router was reachable and accepted the credentials (1) or not (0).";

const char* KindName(MetricKind k) { return k == MetricKind::Counter ? "counter" : "gauge"; }

} // namespace

ExpositionBuilder::ExpositionBuilder() = default;

void ExpositionBuilder::SetLiveness(bool up) { up_ = up; }

void ExpositionBuilder::Add(const std::vector<MetricSample>& samples) {
  for (const auto& s : samples) Add(s);
}

void ExpositionBuilder::Add(MetricSample sample) {
  if (sample.name == kLivenessMetric) {
    up_ = sample.value != 0;
    return;
  }

  auto it = by_name_.find(sample.name);
  if (it == by_name_.end()) {
    it = by_name_.emplace(sample.name, families_.size()).first;
    Family f;
    f.name = sample.name;
    f.kind = sample.kind;
    families_.push_back(std::move(f));
  }
  auto& fam = families_[it->second];
  if (fam.kind != sample.kind) {
    Log()->error("metric {} emitted as {} after {}; sample dropped", sample.name, KindName(sample.kind),
                 KindName(fam.kind));
    return;
  }
  if (fam.help.empty()) fam.help = std::move(sample.help);

  auto key = sample.labels;
  std::sort(key.begin(), key.end());
  if (auto slot = fam.index.find(key); slot != fam.index.end()) {
    ++duplicates_;
    Log()->warn("duplicate series {} ({} labels) in one scrape; keeping the latest value", sample.name,
                sample.labels.size());
    fam.series[slot->second].value = sample.value;
    return;
  }
  fam.index.emplace(std::move(key), fam.series.size());
  fam.series.push_back(Series{std::move(sample.labels), sample.value});
}

std::vector<MetricSample> ExpositionBuilder::Samples() const {
  std::vector<MetricSample> out;
  out.push_back(MetricSample{kLivenessMetric, MetricKind::Gauge, {}, up_ ? 1.0 : 0.0, kLivenessHelp});
  for (const auto& f : families_) {
    for (const auto& s : f.series) out.push_back(MetricSample{f.name, f.kind, s.labels, s.value, f.help});
  }
  return out;
}

std::vector<prometheus::MetricFamily> ExpositionBuilder::Families() const {
  std::vector<prometheus::MetricFamily> out;
  out.reserve(families_.size() + 1);

  prometheus::MetricFamily live;
  live.name = kLivenessMetric;
  live.help = kLivenessHelp;
  live.type = prometheus::MetricType::Gauge;
  prometheus::ClientMetric lm;
  lm.gauge.value = up_ ? 1.0 : 0.0;
  live.metric.push_back(std::move(lm));
  out.push_back(std::move(live));

  for (const auto& f : families_) {
    prometheus::MetricFamily mf;
    mf.name = f.name;
    mf.help = f.help;
    mf.type = f.kind == MetricKind::Counter ? prometheus::MetricType::Counter : prometheus::MetricType::Gauge;
    for (const auto& s : f.series) {
      prometheus::ClientMetric m;
      for (const auto& [k, v] : s.labels) m.label.push_back({k, v});
      if (f.kind == MetricKind::Counter) m.counter.value = s.value;
      else m.gauge.value = s.value;
      mf.metric.push_back(std::move(m));
    }
    out.push_back(std::move(mf));
  }
  return out;
}

std::string ExpositionBuilder::Render() const { return RenderText(Families()); }

std::vector<prometheus::MetricFamily> ToFamilies(const std::vector<MetricSample>& samples) {
  ExpositionBuilder b;
  b.Add(samples);
  return b.Families();
}

std::string RenderText(const std::vector<prometheus::MetricFamily>& families) {
  std::ostringstream oss;
  prometheus::TextSerializer().Serialize(oss, families);
  return oss.str();
}

} // namespace tomexp::exposition

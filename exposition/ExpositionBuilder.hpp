// Accumulates one scrape's samples into Prometheus metric families
#pragma once

#include "core/Types.hpp"

#include <prometheus/metric_family.h>

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace tomexp::exposition {

constexpr const char* kLivenessMetric = "tomato_up";

// Append-only. Samples with the same name stay contiguous in insertion order of
// first appearance; a repeated (name, label set) overwrites the earlier value.
// The liveness gauge is always present and always first.
class ExpositionBuilder {
 public:
  ExpositionBuilder();

  void Add(MetricSample sample);
  void Add(const std::vector<MetricSample>& samples);
  void SetLiveness(bool up);

  bool up() const { return up_; }
  std::size_t duplicates() const { return duplicates_; }

  std::vector<MetricSample> Samples() const;
  std::vector<prometheus::MetricFamily> Families() const;
  std::string Render() const;

 private:
  struct Series {
    std::vector<Label> labels;
    double value = 0;
  };
  struct Family {
    std::string name;
    MetricKind kind = MetricKind::Gauge;
    std::string help;
    std::vector<Series> series;
    std::map<std::vector<Label>, std::size_t> index;  // sorted labels -> series slot
  };

  bool up_ = false;
  std::size_t duplicates_ = 0;
  std::vector<Family> families_;
  std::unordered_map<std::string, std::size_t> by_name_;
};

std::vector<prometheus::MetricFamily> ToFamilies(const std::vector<MetricSample>& samples);

// Prometheus text format 0.0.4 via prometheus::TextSerializer.
std::string RenderText(const std::vector<prometheus::MetricFamily>& families);

} // namespace tomexp::exposition

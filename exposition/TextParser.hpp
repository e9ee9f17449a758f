// Minimal text exposition parser: parses Prometheus text format into MetricFamily
#pragma once
#include <prometheus/metric_family.h>
#include <string>
#include <vector>

namespace tomexp::exposition {

// Parse Prometheus text exposition (counter, gauge and untyped lines) into families.
// HELP and TYPE comments are honoured; label values are unescaped.
// Returns false with `err` naming the first malformed line.
bool ParseTextExposition(const std::string& text, std::vector<prometheus::MetricFamily>& out, std::string& err);

// Value of a parsed sample regardless of family type.
double SampleValue(const prometheus::MetricFamily& family, const prometheus::ClientMetric& metric);

} // namespace tomexp::exposition

// Tokenizing helpers shared by the command-output parsers
#pragma once

#include "core/Types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tomexp::parsers {

// Jiffies per second on every supported firmware (CONFIG_HZ may differ, USER_HZ does not).
constexpr double kUserHz = 100.0;
constexpr std::size_t kSnippetMax = 64;

std::string_view Trim(std::string_view sv);

// Splits on '\n', strips a trailing '\r', drops nothing else.
std::vector<std::string_view> SplitLines(std::string_view text);

// Splits on runs of blanks.
std::vector<std::string_view> SplitFields(std::string_view line);

bool ParseU64(std::string_view sv, std::uint64_t& out);
bool ParseI64(std::string_view sv, std::int64_t& out);
// Accepts a trailing '.' as printed by /proc/net/wireless ("-92.").
bool ParseDouble(std::string_view sv, double& out);

// Bounded, single-line excerpt for error messages.
std::string Snippet(std::string_view text, std::size_t max = kSnippetMax);

MetricSample Gauge(std::string name, double value, std::vector<Label> labels = {}, std::string help = {});
MetricSample Counter(std::string name, double value, std::vector<Label> labels = {}, std::string help = {});

ParseOutcome Failure(const RawOutput& raw, std::string message, std::string_view offending);

} // namespace tomexp::parsers

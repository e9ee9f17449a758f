// Value types shared by the scrape pipeline
#pragma once

#include <tomexp/tomexp.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tomexp {

enum class ErrorKind {
  None,
  AuthRejected,           // router refused the credentials
  MalformedAuthResponse,  // login page carried no session token
  Unauthorized,           // command rejected after the session was valid
  Transport,              // connect/send/recv failure or timeout
  EmptyOutput,            // command ran but returned nothing usable
  Parse,                  // output did not have the expected shape
  Cancelled,              // shutdown requested before the step ran
};

const char* ErrorKindName(ErrorKind kind) noexcept;

enum class MetricKind { Counter, Gauge };

using Label = std::pair<std::string, std::string>;

struct MetricSample {
  std::string name;
  MetricKind  kind = MetricKind::Gauge;
  std::vector<Label> labels;  // keys unique, order as produced
  double      value = 0;
  std::string help;           // family help text; first non-empty wins
};

struct RawOutput {
  std::string collector;  // CommandSpec name
  std::string text;
  std::chrono::system_clock::time_point executed_at{};
};

struct ParseError {
  std::string collector;
  std::string message;
  std::string snippet;  // bounded excerpt of the offending text
};

struct ParseOutcome {
  std::vector<MetricSample> samples;
  bool        failed = false;
  ParseError  error;
  bool ok() const { return !failed; }
};

using ParserFn = ParseOutcome (*)(const RawOutput& raw);

// One collector: a shell command and the parser that understands its output.
struct CommandSpec {
  std::string name;
  std::string command;
  ParserFn    parse = nullptr;
};

struct CollectorOutcome {
  std::string collector;
  ErrorKind   error = ErrorKind::None;
  std::string message;
  double      duration_seconds = 0;
  bool ok() const { return error == ErrorKind::None; }
};

struct ScrapeResult {
  bool up = false;
  ErrorKind auth_error = ErrorKind::None;
  std::string auth_message;
  std::vector<MetricSample> samples;
  std::vector<CollectorOutcome> outcomes;
  double duration_seconds = 0;
};

} // namespace tomexp

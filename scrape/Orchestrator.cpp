#include "scrape/Orchestrator.hpp"

#include "core/Log.hpp"
#include "exposition/ExpositionBuilder.hpp"
#include "scrape/Catalog.hpp"

#include <chrono>

namespace tomexp::scrape {

namespace {

using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point t0) {
  return std::chrono::duration<double>(Clock::now() - t0).count();
}

router::ExecOutcome Cancelled() {
  router::ExecOutcome out;
  out.error = ErrorKind::Cancelled;
  out.message = "scrape cancelled";
  return out;
}

// A transport failure during re-login stays a transport failure; anything else
// means the router no longer accepts us.
router::ExecOutcome ReauthFailed(const router::AuthOutcome& auth) {
  router::ExecOutcome out;
  out.error = auth.error == ErrorKind::Transport ? ErrorKind::Transport : ErrorKind::Unauthorized;
  out.message = std::string("re-authentication failed (") + ErrorKindName(auth.error) + "): " + auth.message;
  return out;
}

std::string Describe(const ParseError& e) {
  if (e.snippet.empty()) return e.message;
  return e.message + " near '" + e.snippet + "'";
}

bool IsBlank(const std::string& s) { return s.find_first_not_of(" \t\r\n") == std::string::npos; }

} // namespace

struct Orchestrator::Cycle {
  Cycle(const Target& target, router::Transport& transport, std::shared_ptr<const router::TokenExtractor> extractor,
        std::shared_ptr<const router::OutputStripper> stripper)
      : session(target, transport, std::move(extractor)), executor(target, transport, std::move(stripper)) {}

  router::SessionManager session;
  router::CommandExecutor executor;
  exposition::ExpositionBuilder builder;
  ScrapeResult result;
};

std::string BatchMarker(const std::string& collector) { return "--tomexp:" + collector + "--"; }

std::string BatchCommand(const std::vector<CommandSpec>& commands) {
  std::string out;
  for (const auto& c : commands) {
    if (!out.empty()) out += "; ";
    out += "echo '" + BatchMarker(c.name) + "'; " + c.command;
  }
  return out;
}

std::map<std::string, std::string> SplitBatchOutput(const std::string& output,
                                                    const std::vector<CommandSpec>& commands) {
  std::map<std::string, std::string> markers;  // marker line -> collector
  for (const auto& c : commands) markers.emplace(BatchMarker(c.name), c.name);

  std::map<std::string, std::string> out;
  std::string* current = nullptr;
  std::size_t pos = 0;
  while (pos < output.size()) {
    auto end = output.find('\n', pos);
    if (end == std::string::npos) end = output.size();
    std::string line = output.substr(pos, end - pos);
    pos = end + 1;

    std::string key = line;
    if (!key.empty() && key.back() == '\r') key.pop_back();
    if (auto it = markers.find(key); it != markers.end()) {
      current = &out[it->second];
      continue;
    }
    if (current) {
      *current += line;
      *current += '\n';
    }
  }
  return out;
}

Orchestrator::Orchestrator(const Target& target, router::Transport& transport)
    : Orchestrator(target, transport, SelectCollectors(target.collectors)) {}

Orchestrator::Orchestrator(const Target& target, router::Transport& transport, std::vector<CommandSpec> commands)
    : target_(target),
      transport_(transport),
      commands_(std::move(commands)),
      extractor_(router::MakeTokenExtractor(target)),
      stripper_(std::make_shared<router::ConsoleOutputStripper>()) {}

ScrapeResult Orchestrator::Scrape(std::stop_token stop) {
  const auto t0 = Clock::now();
  Cycle cycle(target_, transport_, extractor_, stripper_);
  auto& result = cycle.result;
  Log()->debug("target {}: scrape started ({} collectors)", target_.name, commands_.size());

  if (stop.stop_requested()) {
    result.auth_error = ErrorKind::Cancelled;
    result.auth_message = "scrape cancelled before login";
  } else if (auto auth = cycle.session.EnsureSession(); !auth.ok()) {
    result.auth_error = auth.error;
    result.auth_message = auth.message;
    Log()->warn("target {}: authentication failed ({}): {}", target_.name, ErrorKindName(auth.error), auth.message);
  } else {
    result.up = true;
  }

  if (result.up) {
    if (target_.batch_commands && commands_.size() > 1) RunBatched(cycle, stop);
    else RunSequential(cycle, stop);
  }

  cycle.builder.SetLiveness(result.up);
  result.samples = cycle.builder.Samples();
  result.duration_seconds = SecondsSince(t0);

  std::size_t failed = 0;
  for (const auto& o : result.outcomes) failed += o.ok() ? 0 : 1;
  Log()->info("target {}: scrape finished in {:.3f}s, up={}, {} of {} collectors failed", target_.name,
              result.duration_seconds, result.up ? 1 : 0, failed, result.outcomes.size());
  return std::move(result);
}

// At most one login per command: either the one that revives an expired session
// before sending, or the one after the console rejects the session. A failed
// login is final for the cycle, so later commands fail without contacting the router.
router::ExecOutcome Orchestrator::RunWithReauth(Cycle& cycle, const CommandSpec& spec, const std::stop_token& stop) {
  auto& sm = cycle.session;
  bool reauthed = false;
  if (sm.session().state != router::SessionState::Valid) {
    if (stop.stop_requested()) return Cancelled();
    auto auth = sm.EnsureSession();
    reauthed = true;
    if (!auth.ok()) return ReauthFailed(auth);
  }

  auto out = cycle.executor.Run(sm.session(), spec);
  if (out.error != ErrorKind::Unauthorized) return out;
  sm.MarkExpired();
  if (reauthed) return out;

  if (stop.stop_requested()) return Cancelled();
  if (auto auth = sm.EnsureSession(); !auth.ok()) return ReauthFailed(auth);
  out = cycle.executor.Run(sm.session(), spec);
  if (out.error == ErrorKind::Unauthorized) sm.MarkExpired();
  return out;
}

void Orchestrator::RunSequential(Cycle& cycle, const std::stop_token& stop) {
  for (const auto& spec : commands_) {
    const auto t0 = Clock::now();
    CollectorOutcome outcome;
    outcome.collector = spec.name;
    std::vector<MetricSample> samples;

    auto exec = stop.stop_requested() ? Cancelled() : RunWithReauth(cycle, spec, stop);
    if (!exec.ok()) {
      outcome.error = exec.error;
      outcome.message = std::move(exec.message);
    } else if (auto parsed = spec.parse(exec.output); !parsed.ok()) {
      outcome.error = ErrorKind::Parse;
      outcome.message = Describe(parsed.error);
    } else {
      samples = std::move(parsed.samples);
    }
    outcome.duration_seconds = SecondsSince(t0);
    Record(cycle, std::move(outcome), std::move(samples));
  }
}

void Orchestrator::RunBatched(Cycle& cycle, const std::stop_token& stop) {
  const auto t0 = Clock::now();
  const CommandSpec batch{"batch", BatchCommand(commands_), nullptr};
  auto exec = stop.stop_requested() ? Cancelled() : RunWithReauth(cycle, batch, stop);
  const double share = SecondsSince(t0) / static_cast<double>(commands_.size());

  std::map<std::string, std::string> slices;
  if (exec.ok()) slices = SplitBatchOutput(exec.output.text, commands_);

  for (const auto& spec : commands_) {
    const auto p0 = Clock::now();
    CollectorOutcome outcome;
    outcome.collector = spec.name;
    std::vector<MetricSample> samples;

    if (!exec.ok()) {
      outcome.error = exec.error;
      outcome.message = exec.message;
    } else if (auto it = slices.find(spec.name); it == slices.end() || IsBlank(it->second)) {
      outcome.error = ErrorKind::EmptyOutput;
      outcome.message = "no output for '" + spec.name + "' in batch";
    } else {
      RawOutput raw{spec.name, it->second, exec.output.executed_at};
      if (auto parsed = spec.parse(raw); !parsed.ok()) {
        outcome.error = ErrorKind::Parse;
        outcome.message = Describe(parsed.error);
      } else {
        samples = std::move(parsed.samples);
      }
    }
    outcome.duration_seconds = share + SecondsSince(p0);
    Record(cycle, std::move(outcome), std::move(samples));
  }
}

void Orchestrator::Record(Cycle& cycle, CollectorOutcome outcome, std::vector<MetricSample> samples) {
  if (!outcome.ok()) {
    Log()->warn("target {}: collector {} failed ({}): {}", target_.name, outcome.collector,
                ErrorKindName(outcome.error), outcome.message);
  }
  cycle.builder.Add(samples);
  const std::vector<Label> labels = {{"collector", outcome.collector}};
  cycle.builder.Add(MetricSample{kCollectorSuccessMetric, MetricKind::Gauge, labels, outcome.ok() ? 1.0 : 0.0,
                                 "Whether the collector succeeded in this scrape."});
  cycle.builder.Add(MetricSample{kCollectorDurationMetric, MetricKind::Gauge, labels, outcome.duration_seconds,
                                 "Time spent running and parsing the collector's command."});
  cycle.result.outcomes.push_back(std::move(outcome));
}

} // namespace tomexp::scrape

// One scrape cycle against one router: login, run collectors, parse, assemble
#pragma once

#include "core/Types.hpp"
#include "router/CommandExecutor.hpp"
#include "router/HttpClient.hpp"
#include "router/SessionManager.hpp"

#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace tomexp::scrape {

constexpr const char* kCollectorSuccessMetric = "tomato_scrape_collector_success";
constexpr const char* kCollectorDurationMetric = "tomato_scrape_collector_duration_seconds";

// Marker echoed before each command's output in batch mode.
std::string BatchMarker(const std::string& collector);

// Joins the commands into one shell line, each preceded by its marker.
std::string BatchCommand(const std::vector<CommandSpec>& commands);

// Cuts batch output back into per-collector slices. A collector whose marker is
// absent gets no entry.
std::map<std::string, std::string> SplitBatchOutput(const std::string& output,
                                                    const std::vector<CommandSpec>& commands);

class Orchestrator {
 public:
  // Runs the catalog entries the target enables.
  Orchestrator(const Target& target, router::Transport& transport);
  Orchestrator(const Target& target, router::Transport& transport, std::vector<CommandSpec> commands);

  void SetTokenExtractor(std::shared_ptr<const router::TokenExtractor> e) { extractor_ = std::move(e); }
  void SetOutputStripper(std::shared_ptr<const router::OutputStripper> s) { stripper_ = std::move(s); }

  // Never fails as a whole: authentication failures collapse to liveness 0, every
  // other failure is recorded against its collector. Once `stop` is requested no
  // further request is sent to the router.
  ScrapeResult Scrape(std::stop_token stop = {});

  const std::vector<CommandSpec>& commands() const { return commands_; }

 private:
  struct Cycle;

  router::ExecOutcome RunWithReauth(Cycle& cycle, const CommandSpec& spec, const std::stop_token& stop);
  void RunSequential(Cycle& cycle, const std::stop_token& stop);
  void RunBatched(Cycle& cycle, const std::stop_token& stop);
  void Record(Cycle& cycle, CollectorOutcome outcome, std::vector<MetricSample> samples);

  const Target& target_;
  router::Transport& transport_;
  std::vector<CommandSpec> commands_;
  std::shared_ptr<const router::TokenExtractor> extractor_;
  std::shared_ptr<const router::OutputStripper> stripper_;
};

} // namespace tomexp::scrape

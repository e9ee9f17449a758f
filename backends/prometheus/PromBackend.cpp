// Prometheus backend: one prometheus-cpp Exposer, one RouterCollector per target path

#include "backends/prometheus/PromBackend.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"
#include "exposition/ExpositionBuilder.hpp"
#include "scrape/RouterCollector.hpp"

#include <prometheus/exposer.h>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace tomexp {

namespace {

struct Backend {
  std::unique_ptr<prometheus::Exposer> exposer;
  // Kept alive here; the exposer only holds weak references.
  std::vector<std::shared_ptr<scrape::RouterCollector>> collectors;

  // Shared by every collector; Shutdown() requests it so no further router
  // command is issued while in-flight scrapes drain.
  std::stop_source stop;

  Config cfg;
  std::mutex mu;  // serializes Init/Shutdown
  // Lifecycle state for safety around Shutdown/Reinit
  enum class State { Uninitialized, Running, ShuttingDown, Stopped };
  std::atomic<State> state{State::Uninitialized};
};

Backend& G() {
  static Backend* inst = new Backend();
  return *inst;
}

// Caller holds G().mu.
void ShutdownLocked() {
  auto& b = G();
  if (b.state.load(std::memory_order_acquire) != Backend::State::Running) return;
  b.state.store(Backend::State::ShuttingDown, std::memory_order_release);
  b.stop.request_stop();
  // Exposer destruction waits for in-flight handlers; they see the stop request.
  b.exposer.reset();
  b.collectors.clear();
  b.state.store(Backend::State::Stopped, std::memory_order_release);
  Log()->info("exporter stopped");
}

} // namespace

bool Init(const Config& in) noexcept {
  std::lock_guard<std::mutex> lk(G().mu);
  auto& b = G();
  try {
    // If already running, perform a safe shutdown to allow re-init.
    ShutdownLocked();

    Config cfg = in;
    std::string err;
    if (!ValidateConfig(cfg, err)) {
      Log()->error("invalid configuration: {}", err);
      return false;
    }
    if (!ConfigureLogging(cfg.log, err)) {
      Log()->error("invalid configuration: {}", err);
      return false;
    }

    b.stop = std::stop_source();
    const std::string addr = cfg.host + ":" + std::to_string(cfg.port);
    b.exposer = std::make_unique<prometheus::Exposer>(addr);
    for (const auto& t : cfg.targets) {
      auto collector = std::make_shared<scrape::RouterCollector>(t, b.stop.get_token());
      b.exposer->RegisterCollectable(collector, t.path);
      b.collectors.push_back(std::move(collector));
      Log()->info("target {}: {}://{}:{} served on {}", t.name, t.scheme, t.host, t.port, t.path);
    }
    b.cfg = std::move(cfg);
    b.state.store(Backend::State::Running, std::memory_order_release);
    Log()->info("exporter listening on {}", addr);
    return true;
  } catch (const std::exception& e) {
    Log()->error("exporter failed to start: {}", e.what());
  }
  b.exposer.reset();
  b.collectors.clear();
  b.state.store(Backend::State::Stopped, std::memory_order_release);
  return false;
}

bool InitFromToml(const std::string& toml_path) noexcept {
  try {
    Config cfg;
    std::string err;
    if (!ParseConfigToml(toml_path, cfg, err)) {
      Log()->error("config {}: {}", toml_path, err);
      return false;
    }
    return Init(cfg);
  } catch (const std::exception& e) {
    Log()->error("config {}: {}", toml_path, e.what());
    return false;
  }
}

void Shutdown() noexcept {
  std::lock_guard<std::mutex> lk(G().mu);
  try {
    ShutdownLocked();
  } catch (const std::exception& e) {
    G().state.store(Backend::State::Stopped, std::memory_order_release);
    Log()->error("exporter shutdown: {}", e.what());
  }
}

bool IsRunning() noexcept {
  return G().state.load(std::memory_order_acquire) == Backend::State::Running;
}

std::vector<int> ListeningPorts() noexcept {
  std::lock_guard<std::mutex> lk(G().mu);
  if (!G().exposer) return {};
  try {
    return G().exposer->GetListeningPorts();
  } catch (const std::exception& e) {
    Log()->error("listening ports: {}", e.what());
    return {};
  }
}

std::shared_ptr<scrape::RouterCollector> RegisteredCollector(const std::string& name) noexcept {
  std::lock_guard<std::mutex> lk(G().mu);
  if (G().state.load(std::memory_order_acquire) != Backend::State::Running) return nullptr;
  for (const auto& c : G().collectors) {
    if (c->target().name == name) return c;
  }
  return nullptr;
}

std::string ScrapeTargetText(const Target& target, bool* up) noexcept {
  if (up) *up = false;
  try {
    Config cfg;
    cfg.targets.push_back(target);
    std::string err;
    if (!ValidateConfig(cfg, err)) {
      Log()->error("target {}: {}", target.name, err);
      return exposition::ExpositionBuilder().Render();
    }
    // A router the exporter already serves is scraped through its collector so
    // the per-target lock covers this cycle too.
    const auto& t = cfg.targets.front();
    auto collector = RegisteredCollector(t.name);
    if (collector) {
      const auto& served = collector->target();
      if (served.scheme != t.scheme || served.host != t.host || served.port != t.port ||
          served.username != t.username) {
        collector.reset();
      }
    }
    if (!collector) collector = std::make_shared<scrape::RouterCollector>(t, std::stop_token{});
    const auto result = collector->ScrapeOnce();
    if (up) *up = result.up;
    return exposition::RenderText(exposition::ToFamilies(result.samples));
  } catch (const std::exception& e) {
    Log()->error("target {}: {}", target.name, e.what());
  }
  return {};
}

} // namespace tomexp

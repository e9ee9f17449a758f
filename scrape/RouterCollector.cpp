#include "scrape/RouterCollector.hpp"

#include "core/Log.hpp"
#include "exposition/ExpositionBuilder.hpp"
#include "scrape/Orchestrator.hpp"

#include <exception>

namespace tomexp::scrape {

router::Endpoint EndpointFor(const Target& target) {
  router::Endpoint ep;
  ep.scheme = target.scheme;
  ep.host = target.host;
  ep.port = target.port;
  ep.verify_tls = target.verify_tls;
  ep.connect_timeout = target.timeouts.connect;
  return ep;
}

RouterCollector::RouterCollector(Target target, std::stop_token stop)
    : target_(std::move(target)),
      stop_(std::move(stop)),
      transport_(std::make_unique<router::SocketTransport>(EndpointFor(target_))) {}

RouterCollector::RouterCollector(Target target, std::stop_token stop, std::unique_ptr<router::Transport> transport)
    : target_(std::move(target)), stop_(std::move(stop)), transport_(std::move(transport)) {}

ScrapeResult RouterCollector::ScrapeOnce() const {
  std::lock_guard<std::mutex> lk(mu_);
  cycles_.fetch_add(1, std::memory_order_relaxed);
  try {
    Orchestrator orchestrator(target_, *transport_);
    return orchestrator.Scrape(stop_);
  } catch (const std::exception& e) {
    Log()->error("target {}: scrape aborted: {}", target_.name, e.what());
  } catch (...) {
    Log()->error("target {}: scrape aborted by unknown exception", target_.name);
  }
  ScrapeResult down;
  down.auth_error = ErrorKind::Transport;
  down.auth_message = "internal error";
  exposition::ExpositionBuilder b;
  down.samples = b.Samples();
  return down;
}

std::vector<prometheus::MetricFamily> RouterCollector::Collect() const {
  const auto result = ScrapeOnce();
  try {
    return exposition::ToFamilies(result.samples);
  } catch (const std::exception& e) {
    Log()->error("target {}: failed to assemble exposition: {}", target_.name, e.what());
    return {};
  }
}

} // namespace tomexp::scrape

// RouterCollector: a Collectable that scrapes one router per Collect() call
#pragma once

#include "core/Types.hpp"
#include "router/HttpClient.hpp"

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

namespace tomexp::scrape {

router::Endpoint EndpointFor(const Target& target);

class RouterCollector : public prometheus::Collectable {
 public:
  // Talks to the router over a SocketTransport built from the target.
  RouterCollector(Target target, std::stop_token stop);
  RouterCollector(Target target, std::stop_token stop, std::unique_ptr<router::Transport> transport);

  // One full scrape cycle. Concurrent calls for the same target are serialized.
  std::vector<prometheus::MetricFamily> Collect() const override;

  // Same cycle, returning the structured result. Never throws.
  ScrapeResult ScrapeOnce() const;

  const Target& target() const { return target_; }
  // Scrape cycles run so far, including the one in progress.
  std::uint64_t cycles() const { return cycles_.load(std::memory_order_relaxed); }

 private:
  Target target_;
  std::stop_token stop_;
  std::unique_ptr<router::Transport> transport_;
  mutable std::mutex mu_;  // one cycle at a time against this router
  mutable std::atomic<std::uint64_t> cycles_{0};
};

} // namespace tomexp::scrape

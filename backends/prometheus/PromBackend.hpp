// Backend internals shared with the one-shot scrape path and tests
#pragma once

#include <tomexp/tomexp.hpp>
#include "scrape/RouterCollector.hpp"

#include <memory>
#include <string>

namespace tomexp {

// The collector the running exporter serves for target `name`; null when the
// backend is not running or serves no such target.
std::shared_ptr<scrape::RouterCollector> RegisteredCollector(const std::string& name) noexcept;

} // namespace tomexp

// Static, ordered collector catalog
#pragma once

#include "core/Types.hpp"

#include <string>
#include <vector>

namespace tomexp::scrape {

// Every known collector, in execution order.
const std::vector<CommandSpec>& Catalog();

// Name -> enabled for every catalog entry, before per-target overrides.
CollectorSet DefaultCollectors();

bool IsKnownCollector(const std::string& name);

// Catalog entries enabled for `collectors`, in catalog order. Names missing from
// `collectors` fall back to their default.
std::vector<CommandSpec> SelectCollectors(const CollectorSet& collectors);

} // namespace tomexp::scrape

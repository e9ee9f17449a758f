#include "scrape/Catalog.hpp"

#include "parsers/Parsers.hpp"

#include <algorithm>

namespace tomexp::scrape {

namespace {

std::vector<CommandSpec> BuildCatalog() {
  return {
      {"cpu", "cat /proc/stat", &parsers::ParseCpuStat},
      {"meminfo", "cat /proc/meminfo", &parsers::ParseMeminfo},
      {"loadavg", "cat /proc/loadavg", &parsers::ParseLoadavg},
      {"time", "date +%s; cat /proc/uptime", &parsers::ParseTime},
      {"uname", "uname -a", &parsers::ParseUname},
      {"netdev", "cat /proc/net/dev", &parsers::ParseNetDev},
      {"filesystem", std::string("cat /proc/mounts; echo ") + parsers::kFilesystemSeparator + "; df -k",
       &parsers::ParseFilesystem},
      {"wireless", "cat /proc/net/wireless", &parsers::ParseWireless},
  };
}

// Off unless a target asks for it.
bool DefaultEnabled(const std::string& name) { return name != "wireless"; }

} // namespace

const std::vector<CommandSpec>& Catalog() {
  static const std::vector<CommandSpec> catalog = BuildCatalog();
  return catalog;
}

CollectorSet DefaultCollectors() {
  CollectorSet out;
  for (const auto& c : Catalog()) out[c.name] = DefaultEnabled(c.name);
  return out;
}

bool IsKnownCollector(const std::string& name) {
  const auto& c = Catalog();
  return std::any_of(c.begin(), c.end(), [&](const CommandSpec& s) { return s.name == name; });
}

std::vector<CommandSpec> SelectCollectors(const CollectorSet& collectors) {
  std::vector<CommandSpec> out;
  for (const auto& c : Catalog()) {
    const auto it = collectors.find(c.name);
    const bool enabled = it == collectors.end() ? DefaultEnabled(c.name) : it->second;
    if (enabled) out.push_back(c);
  }
  return out;
}

} // namespace tomexp::scrape

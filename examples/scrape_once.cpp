// Runs a single scrape cycle and prints the document: handy when bringing up a new router.
#include <tomexp/tomexp.hpp>
#include "core/Config.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " <config.toml> [target]" << std::endl;
    return 2;
  }

  tomexp::Config cfg;
  std::string err;
  if (!tomexp::ParseConfigToml(argv[1], cfg, err)) {
    std::cerr << argv[1] << ": " << err << std::endl;
    return 2;
  }
  if (!tomexp::ConfigureLogging(cfg.log, err)) {
    std::cerr << argv[1] << ": " << err << std::endl;
    return 2;
  }

  auto it = cfg.targets.begin();
  if (argc == 3) {
    const std::string name = argv[2];
    it = std::find_if(cfg.targets.begin(), cfg.targets.end(), [&](const tomexp::Target& t) { return t.name == name; });
    if (it == cfg.targets.end()) {
      std::cerr << "no target named '" << name << "' in " << argv[1] << std::endl;
      return 2;
    }
  }

  bool up = false;
  std::cout << tomexp::ScrapeTargetText(*it, &up);
  return up ? 0 : 1;
}

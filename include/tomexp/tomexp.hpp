#pragma once
// tomexp public API
// - One HTTP listener, one exposition path per router target
// - Each GET on a target's path runs a fresh scrape cycle against that router
// - Programmatic config or TOML file (see core/Config.hpp for the schema)

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace tomexp {

struct Timeouts {
  std::chrono::milliseconds connect{5000};
  std::chrono::milliseconds auth{10000};
  std::chrono::milliseconds command{15000};
};

// Ordered name -> enabled flags. Unknown names are rejected by config validation.
using CollectorSet = std::map<std::string, bool>;

struct Target {
  std::string name;
  std::string scheme = "http";  // http|https
  std::string host;
  int         port = 0;         // 0: 80 for http, 443 for https
  std::string username;
  std::string password;
  std::string path;             // exposition path this target is served on
  std::string auth_path = "/";
  std::string http_id;          // fixed session token; skips extraction when set
  std::string token_pattern;    // regex override, first capture group is the token
  bool        verify_tls = false;
  bool        batch_commands = false;
  Timeouts    timeouts;
  CollectorSet collectors;
};

struct LogConfig {
  std::string level = "info";  // trace|debug|info|warn|error|critical|off
  std::string pattern;         // spdlog pattern; empty keeps the default
};

struct Config {
  std::string host = "0.0.0.0";   // bind host for HTTP exposer
  int         port = 9713;        // bind port for HTTP exposer; 0 picks a free one
  std::string path = "/metrics";  // default exposition path
  LogConfig   log;
  std::vector<Target> targets;
};

// Lifecycle
// Validates cfg (filling target defaults), starts the listener and registers every target.
bool Init(const Config& cfg) noexcept;
// Init from TOML path (uses ParseConfigToml internally); returns false on parse or init failure.
bool InitFromToml(const std::string& toml_path) noexcept;
// Stops issuing router commands, then tears down the listener.
void Shutdown() noexcept;

// Returns whether the backend is currently running (thread-safe).
bool IsRunning() noexcept;

// Bound listener ports; empty when not running.
std::vector<int> ListeningPorts() noexcept;

// Runs one scrape cycle against `target` outside the listener and returns the
// rendered exposition document. `up` receives the liveness value when non-null.
std::string ScrapeTargetText(const Target& target, bool* up = nullptr) noexcept;

} // namespace tomexp

// Config parsing and validation
#pragma once
#include <tomexp/tomexp.hpp>

#include <string>
#include <string_view>

namespace tomexp {

// Schema:
//   [exporter]  host, port, path
//   [log]       level, pattern
//   [[targets]] name, host, port, scheme, username, password, path, auth_path,
//               http_id, token_pattern, verify_tls, batch_commands
//     [targets.timeouts]   connect_ms, auth_ms, command_ms
//     [targets.collectors] <collector> = bool
bool ParseConfigToml(const std::string& path, Config& out, std::string& err);
bool ParseConfigTomlString(std::string_view doc, Config& out, std::string& err);

// Fills target defaults (port by scheme, exposition paths, collector set) and
// checks everything a scrape relies on. err names the offending key.
bool ValidateConfig(Config& cfg, std::string& err);

} // namespace tomexp

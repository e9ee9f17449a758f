// TOML config loader using toml++ (header-only)
#include "Config.hpp"

#include "scrape/Catalog.hpp"

#include <cstdint>
#include <regex>
#include <set>
#include <string>

#include <toml++/toml.h>

namespace tomexp {

namespace {

// Each reader leaves `out` untouched when the key is absent and fails on a wrong type.
bool read_string(const toml::table& t, std::string_view key, std::string& out, const std::string& where,
                 std::string& err) {
  const auto* n = t.get(key);
  if (!n) return true;
  if (auto v = n->value_exact<std::string>()) {
    out = *v;
    return true;
  }
  err = where + std::string(key) + ": expected a string";
  return false;
}

bool read_int(const toml::table& t, std::string_view key, std::int64_t& out, const std::string& where,
              std::string& err) {
  const auto* n = t.get(key);
  if (!n) return true;
  if (auto v = n->value_exact<std::int64_t>()) {
    out = *v;
    return true;
  }
  err = where + std::string(key) + ": expected an integer";
  return false;
}

bool read_bool(const toml::table& t, std::string_view key, bool& out, const std::string& where, std::string& err) {
  const auto* n = t.get(key);
  if (!n) return true;
  if (auto v = n->value_exact<bool>()) {
    out = *v;
    return true;
  }
  err = where + std::string(key) + ": expected true or false";
  return false;
}

bool read_timeout(const toml::table& t, std::string_view key, std::chrono::milliseconds& out,
                  const std::string& where, std::string& err) {
  std::int64_t ms = out.count();
  if (!read_int(t, key, ms, where, err)) return false;
  if (ms <= 0) {
    err = where + std::string(key) + ": must be positive";
    return false;
  }
  out = std::chrono::milliseconds(ms);
  return true;
}

bool ParseTarget(const toml::table& t, std::size_t index, Target& out, std::string& err) {
  const std::string where = "targets[" + std::to_string(index) + "].";
  std::int64_t port = 0;
  if (!read_string(t, "name", out.name, where, err) || !read_string(t, "host", out.host, where, err) ||
      !read_string(t, "scheme", out.scheme, where, err) || !read_int(t, "port", port, where, err) ||
      !read_string(t, "username", out.username, where, err) ||
      !read_string(t, "password", out.password, where, err) || !read_string(t, "path", out.path, where, err) ||
      !read_string(t, "auth_path", out.auth_path, where, err) ||
      !read_string(t, "http_id", out.http_id, where, err) ||
      !read_string(t, "token_pattern", out.token_pattern, where, err) ||
      !read_bool(t, "verify_tls", out.verify_tls, where, err) ||
      !read_bool(t, "batch_commands", out.batch_commands, where, err)) {
    return false;
  }
  if (port < 0 || port > 65535) {
    err = where + "port: out of range";
    return false;
  }
  out.port = static_cast<int>(port);  // 0 = scheme default, resolved by ValidateConfig

  if (const auto* n = t.get("timeouts")) {
    const auto* tt = n->as_table();
    if (!tt) {
      err = where + "timeouts: expected a table";
      return false;
    }
    const auto w = where + "timeouts.";
    if (!read_timeout(*tt, "connect_ms", out.timeouts.connect, w, err) ||
        !read_timeout(*tt, "auth_ms", out.timeouts.auth, w, err) ||
        !read_timeout(*tt, "command_ms", out.timeouts.command, w, err)) {
      return false;
    }
  }

  if (const auto* n = t.get("collectors")) {
    const auto* ct = n->as_table();
    if (!ct) {
      err = where + "collectors: expected a table";
      return false;
    }
    for (auto&& [k, v] : *ct) {
      const std::string name{std::string_view{k}};
      auto on = v.value_exact<bool>();
      if (!on) {
        err = where + "collectors." + name + ": expected true or false";
        return false;
      }
      out.collectors[name] = *on;
    }
  }
  return true;
}

bool ParseTable(const toml::table& tbl, Config& out, std::string& err) {
  // exporter
  if (const auto* n = tbl.get("exporter")) {
    const auto* exporter = n->as_table();
    if (!exporter) {
      err = "exporter: expected a table";
      return false;
    }
    std::int64_t port = out.port;
    if (!read_string(*exporter, "host", out.host, "exporter.", err) ||
        !read_int(*exporter, "port", port, "exporter.", err) ||
        !read_string(*exporter, "path", out.path, "exporter.", err)) {
      return false;
    }
    if (port < 0 || port > 65535) {
      err = "exporter.port: out of range";
      return false;
    }
    out.port = static_cast<int>(port);
  }

  // log
  if (const auto* n = tbl.get("log")) {
    const auto* log = n->as_table();
    if (!log) {
      err = "log: expected a table";
      return false;
    }
    if (!read_string(*log, "level", out.log.level, "log.", err) ||
        !read_string(*log, "pattern", out.log.pattern, "log.", err)) {
      return false;
    }
  }

  // targets
  const auto* n = tbl.get("targets");
  const auto* targets = n ? n->as_array() : nullptr;
  if (!targets) {
    err = "targets: expected at least one [[targets]] table";
    return false;
  }
  std::size_t i = 0;
  for (auto&& el : *targets) {
    const auto* t = el.as_table();
    if (!t) {
      err = "targets[" + std::to_string(i) + "]: expected a table";
      return false;
    }
    Target target;
    if (!ParseTarget(*t, i, target, err)) return false;
    out.targets.push_back(std::move(target));
    ++i;
  }
  return ValidateConfig(out, err);
}

} // namespace

bool ValidateConfig(Config& cfg, std::string& err) {
  if (cfg.path.empty() || cfg.path.front() != '/') {
    err = "exporter.path: must start with '/'";
    return false;
  }
  if (cfg.port < 0 || cfg.port > 65535) {
    err = "exporter.port: out of range";
    return false;
  }
  if (cfg.targets.empty()) {
    err = "targets: at least one target is required";
    return false;
  }

  std::set<std::string> names, paths;
  const std::string base = cfg.path.back() == '/' ? cfg.path.substr(0, cfg.path.size() - 1) : cfg.path;
  for (std::size_t i = 0; i < cfg.targets.size(); ++i) {
    auto& t = cfg.targets[i];
    const std::string where = "targets[" + std::to_string(i) + "].";

    if (t.name.empty()) {
      err = where + "name: required";
      return false;
    }
    if (!names.insert(t.name).second) {
      err = where + "name: duplicate target '" + t.name + "'";
      return false;
    }
    if (t.host.empty()) {
      err = where + "host: required";
      return false;
    }
    if (t.scheme != "http" && t.scheme != "https") {
      err = where + "scheme: expected http or https, got '" + t.scheme + "'";
      return false;
    }
    if (t.port == 0) t.port = t.scheme == "https" ? 443 : 80;
    if (t.port < 0 || t.port > 65535) {
      err = where + "port: out of range";
      return false;
    }
    if (t.path.empty()) t.path = i == 0 ? cfg.path : base + "/" + t.name;
    if (t.path.front() != '/') {
      err = where + "path: must start with '/'";
      return false;
    }
    if (!paths.insert(t.path).second) {
      err = where + "path: '" + t.path + "' already used by another target";
      return false;
    }
    if (t.auth_path.empty()) t.auth_path = "/";
    if (t.auth_path.front() != '/') {
      err = where + "auth_path: must start with '/'";
      return false;
    }
    if (t.timeouts.connect.count() <= 0 || t.timeouts.auth.count() <= 0 || t.timeouts.command.count() <= 0) {
      err = where + "timeouts: must be positive";
      return false;
    }
    if (!t.token_pattern.empty()) {
      try {
        std::regex re(t.token_pattern);
        if (re.mark_count() < 1) {
          err = where + "token_pattern: needs a capture group for the token";
          return false;
        }
      } catch (const std::regex_error& e) {
        err = where + "token_pattern: " + e.what();
        return false;
      }
    }

    auto collectors = scrape::DefaultCollectors();
    for (const auto& [name, on] : t.collectors) {
      if (!scrape::IsKnownCollector(name)) {
        err = where + "collectors." + name + ": unknown collector";
        return false;
      }
      collectors[name] = on;
    }
    t.collectors = std::move(collectors);
  }
  return true;
}

bool ParseConfigToml(const std::string& path, Config& out, std::string& err) {
  try {
    auto tbl = toml::parse_file(path);
    return ParseTable(tbl, out, err);
  } catch (const toml::parse_error& e) {
    err = path + ": " + std::string(e.description());
  } catch (const std::exception& e) {
    err = e.what();
  }
  return false;
}

bool ParseConfigTomlString(std::string_view doc, Config& out, std::string& err) {
  try {
    auto tbl = toml::parse(doc);
    return ParseTable(tbl, out, err);
  } catch (const toml::parse_error& e) {
    err = std::string(e.description());
  } catch (const std::exception& e) {
    err = e.what();
  }
  return false;
}

} // namespace tomexp

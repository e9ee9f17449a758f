// Runs one shell command through the router's web console (shell.cgi)
#pragma once

#include "core/Types.hpp"
#include "router/HttpClient.hpp"
#include "router/SessionManager.hpp"

#include <memory>
#include <string>

namespace tomexp::router {

// Removes the UI wrapper around command stdout. Firmware-dependent, hence pluggable.
class OutputStripper {
 public:
  virtual ~OutputStripper() = default;
  virtual std::string Strip(const std::string& body) const = 0;
};

// Tries, in order: a <pre> block (HTML entities decoded), a JS assignment
// `cmdresult = '...';` (JS escapes decoded), then the body as-is.
class ConsoleOutputStripper : public OutputStripper {
 public:
  std::string Strip(const std::string& body) const override;
};

std::string DecodeHtmlEntities(const std::string& in);
std::string DecodeJsString(const std::string& in);

struct ExecOutcome {
  ErrorKind   error = ErrorKind::None;
  std::string message;
  RawOutput   output;
  bool ok() const { return error == ErrorKind::None; }
};

class CommandExecutor {
 public:
  static constexpr const char* kConsolePath = "/shell.cgi";

  CommandExecutor(const Target& target, Transport& transport,
                  std::shared_ptr<const OutputStripper> stripper = std::make_shared<ConsoleOutputStripper>());

  // Sends the command with the session token. Never retries; a rejected session
  // comes back as ErrorKind::Unauthorized for the caller to re-authenticate.
  ExecOutcome Run(const Session& session, const CommandSpec& spec);

 private:
  const Target& target_;
  Transport& transport_;
  std::shared_ptr<const OutputStripper> stripper_;
  std::string authorization_;
};

} // namespace tomexp::router

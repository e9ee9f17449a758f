#include "core/Types.hpp"

namespace tomexp {

const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::AuthRejected: return "auth_rejected";
    case ErrorKind::MalformedAuthResponse: return "malformed_auth_response";
    case ErrorKind::Unauthorized: return "unauthorized";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::EmptyOutput: return "empty_output";
    case ErrorKind::Parse: return "parse";
    case ErrorKind::Cancelled: return "cancelled";
  }
  return "unknown";
}

} // namespace tomexp

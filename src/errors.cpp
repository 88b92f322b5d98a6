#include "errors.hpp"
#include "driver_codes.hpp"
#include <fmt/format.h>

std::string_view to_string(InitError err) {
  switch (err) {
    case InitError::Locked: return "locked";
    case InitError::UnsupportedTerminal: return "unsupported terminal";
    case InitError::FailedToOpenTty: return "failed to open tty";
    case InitError::PipeTrapError: return "pipe trap error";
    case InitError::Unknown: return "unknown init error";
  }
  return "unknown init error";
}

std::optional<InitError> init_error_from_code(int code) {
  switch (code) {
    case TBOX_INIT_OK: return std::nullopt;
    case TBOX_EUNSUPPORTED_TERMINAL: return InitError::UnsupportedTerminal;
    case TBOX_EFAILED_TO_OPEN_TTY: return InitError::FailedToOpenTty;
    case TBOX_EPIPE_TRAP_ERROR: return InitError::PipeTrapError;
    default: return InitError::Unknown;
  }
}

std::string_view to_string(DecodeError::Kind kind) {
  switch (kind) {
    case DecodeError::Kind::UnknownEventKind: return "unrecognized event kind";
    case DecodeError::Kind::UnknownMouseButton: return "unknown mouse button";
    case DecodeError::Kind::UnknownInputMode: return "unknown input mode";
    case DecodeError::Kind::UnknownOutputMode: return "unknown output mode";
  }
  return "decode error";
}

DecodeError::DecodeError(Kind kind, long raw)
  : std::runtime_error(fmt::format("{} ({})", to_string(kind), raw)), kind_(kind), raw_(raw) {}

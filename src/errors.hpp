#pragma once
/*
 * Errors
 *
 * Purpose: typed failure outcomes of session open, event decode and event reads.
 * Usage: InitError comes back through Session::open's out-parameter;
 *        DecodeError/EventError are thrown since they signal a broken driver contract.
 */
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

enum class InitError { Locked, UnsupportedTerminal, FailedToOpenTty, PipeTrapError, Unknown };

std::string_view to_string(InitError err);
// 0 is success (nullopt); codes outside the fixed set map to InitError::Unknown
std::optional<InitError> init_error_from_code(int code);

class DecodeError : public std::runtime_error {
public:
  enum class Kind { UnknownEventKind, UnknownMouseButton, UnknownInputMode, UnknownOutputMode };
  DecodeError(Kind kind, long raw);
  Kind kind() const noexcept { return kind_; }
  long raw() const noexcept { return raw_; }
private:
  Kind kind_;
  long raw_;
};

std::string_view to_string(DecodeError::Kind kind);

// negative driver result while reading events
class EventError : public std::runtime_error {
public:
  EventError(const std::string& what, int code) : std::runtime_error(what), code_(code) {}
  int code() const noexcept { return code_; }
private:
  int code_;
};

#pragma once
/*
================================================================================
Fragment 1.2 — Core: Engine Error Type
FILE: cpp/engine/core/error.hpp

Purpose:
  - Single exception type for the plan compiler: a stable error code, the
    human message, and the throw site for deployment diagnostics.

Contract:
  - Thrown only for deployment-time problems (malformed policy pack, unreadable
    input files, invalid settings) and for misuse of pure functions.
  - Per-well data-quality problems are NEVER thrown; they become Violations.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace plugplan {

enum class ErrorCode : int {
  kInvalidArgument = 1,  // bad settings, bad CLI input, misuse of a pure function
  kOutOfRange      = 2,
  kParseError      = 3,  // YAML/JSON that cannot be read as a pack, facts or settings
  kIoError         = 4,
  kInvariant       = 5,  // engine bug (e.g. unknown violation rule id)
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kInvalidArgument: return "InvalidArgument";
    case ErrorCode::kOutOfRange: return "OutOfRange";
    case ErrorCode::kParseError: return "ParseError";
    case ErrorCode::kIoError: return "IoError";
    case ErrorCode::kInvariant: return "Invariant";
  }
  return "Unknown";
}

// Input-side failures: the caller handed us something unreadable.
inline bool is_input_error(ErrorCode c) noexcept {
  return c == ErrorCode::kParseError || c == ErrorCode::kIoError;
}

struct ThrowSite {
  const char* file = "";
  int line = 0;
  const char* function = "";
};

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message, ThrowSite site = {})
      : std::runtime_error(describe(code, message, site)),
        code_(code),
        message_(std::move(message)),
        site_(site) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  const ThrowSite& site() const noexcept { return site_; }

 private:
  static std::string describe(ErrorCode code, const std::string& msg, const ThrowSite& site) {
    std::string out = std::string(to_string(code)) + ": " + msg;
    if (site.file != nullptr && *site.file != '\0') {
      out += " [" + std::string(site.file) + ":" + std::to_string(site.line);
      if (site.function != nullptr && *site.function != '\0') out += " in " + std::string(site.function);
      out += "]";
    }
    return out;
  }

  ErrorCode code_;
  std::string message_;
  ThrowSite site_;
};

[[noreturn]] inline void throw_error(ErrorCode code, std::string message, ThrowSite site) {
  throw Error(code, std::move(message), site);
}

inline void ensure(bool ok, ErrorCode code, std::string message, ThrowSite site) {
  if (!ok) throw_error(code, std::move(message), site);
}

}  // namespace plugplan

#define PLUGPLAN_SITE ::plugplan::ThrowSite{__FILE__, __LINE__, __func__}
#define PLUGPLAN_THROW(CODE, MSG) ::plugplan::throw_error((CODE), (MSG), PLUGPLAN_SITE)
#define PLUGPLAN_ENSURE(EXPR, CODE, MSG) ::plugplan::ensure((EXPR), (CODE), (MSG), PLUGPLAN_SITE)

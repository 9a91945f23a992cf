#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Process-wide logger shared by the policy store, resolver, step
    generator and CLI.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe; concurrent plan compilations may log at once.
  - WARN/ERROR go to stderr so plan JSON on stdout stays clean.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace plugplan {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

LogLevel get_log_level() noexcept;

// Accepts "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace plugplan

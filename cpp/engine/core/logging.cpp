/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Lines are formatted into a fixed stack buffer and written with stdio, so
the hot path never allocates and has nothing to throw.
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace plugplan {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mu;

constexpr size_t kStampLen = sizeof("YYYY-MM-DDTHH:MM:SSZ");

const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

void utc_stamp(char (&buf)[kStampLen]) noexcept {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &now);
#else
  gmtime_r(&now, &tm);
#endif
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) buf[0] = '\0';
}

char lower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower_ascii(a[i]) != b[i]) return false;
  }
  return true;
}

} // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  if (iequals(s, "debug")) return LogLevel::DEBUG;
  if (iequals(s, "info")) return LogLevel::INFO;
  if (iequals(s, "warn") || iequals(s, "warning")) return LogLevel::WARN;
  if (iequals(s, "error")) return LogLevel::ERROR;
  return std::nullopt;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

  char stamp[kStampLen];
  utc_stamp(stamp);

  std::FILE* out = (lvl >= LogLevel::WARN) ? stderr : stdout;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::fprintf(out, "[%s][%s] %.*s\n", stamp, level_tag(lvl), static_cast<int>(msg.size()), msg.data());
  std::fflush(out);
}

} // namespace plugplan

#pragma once
/*
  Fragment 1.8 — Shared Selftest Helpers

  Framework-free expectations used by every *_selftest.cpp executable.
  Each test binary calls the helpers, then returns selftest::exit_code()
  (non-zero when any expectation failed).
*/

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace plugplan::selftest {

inline int g_fail_count = 0;

inline void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

inline void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

inline void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

inline void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_eq_int(long long a, long long b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  got " << a << ", expected " << b << "\n";
  } else {
    pass(msg);
  }
}

inline void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got " << a << ", expected " << b << " (tol " << tol << ")\n";
  } else {
    pass(msg);
  }
}

inline void expect_near(const std::optional<double>& a, double b, double tol, std::string_view msg) {
  if (!a.has_value()) {
    fail(msg);
    std::cerr << "  got <none>, expected " << b << "\n";
    return;
  }
  expect_near(*a, b, tol, msg);
}

// Runs `fn` and passes if it throws E.
template <class E, class Fn>
void expect_throws(Fn&& fn, std::string_view msg) {
  try {
    fn();
  } catch (const E&) {
    pass(msg);
    return;
  }
  fail(msg);
  std::cerr << "  expected an exception\n";
}

inline int exit_code(std::string_view suite) {
  if (g_fail_count == 0) {
    std::cerr << "[PASS] " << suite << "\n";
    return 0;
  }
  std::cerr << "[FAILED] " << suite << ": " << g_fail_count << " failure(s)\n";
  return 1;
}

} // namespace plugplan::selftest

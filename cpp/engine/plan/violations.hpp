#pragma once
/*
================================================================================
Fragment 5.4 — Plan: Violation Catalog + Log
FILE: cpp/engine/plan/violations.hpp

Purpose:
  - Central catalog for violation rule ids, each with a fixed severity, so
    codes and their severity cannot drift between rules.
  - Diagnostic only: recording a violation never aborts generation.

Rules enforced:
  - add() with an id missing from the catalog is a programming error and
    throws Error{kInvariant}.
  - Entries are unique by "rule_id|context" and keep insertion order, which
    is deterministic because the rule pipeline is.
================================================================================
*/

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace plugplan::plan {

enum class Severity : int {
  kInfo = 0,
  kWarning = 1,
  kError = 2,
  kCritical = 3,
};

const char* to_string(Severity s) noexcept;

struct Violation {
  Severity severity = Severity::kInfo;
  std::string rule_id;
  std::string message;
  std::string context;
};

bool is_known_rule_id(std::string_view rule_id);

// Only valid when is_known_rule_id(rule_id) is true.
Severity severity_for_rule(std::string_view rule_id);

class ViolationLog {
 public:
  void add(std::string_view rule_id, std::string message, std::string context = {});
  void append(const ViolationLog& other);

  const std::vector<Violation>& items() const noexcept { return items_; }
  bool empty() const noexcept { return items_.empty(); }
  size_t size() const noexcept { return items_.size(); }
  bool contains(std::string_view rule_id) const;

  // Any error/critical entry.
  bool has_blocking() const;

 private:
  std::vector<Violation> items_;
  std::unordered_set<std::string> seen_;
};

} // namespace plugplan::plan

#include "engine/plan/violations.hpp"

#include <unordered_map>
#include <utility>

#include "engine/core/error.hpp"

namespace plugplan::plan {

namespace {

const std::unordered_map<std::string_view, Severity>& catalog() {
  // string_view keys point to literals; static lifetime.
  static const std::unordered_map<std::string_view, Severity> k = {
      // ---- Missing facts ----
      {"SURFACE_SHOE_DEPTH_UNKNOWN", Severity::kError},
      {"PRODUCTION_SHOE_DEPTH_UNKNOWN", Severity::kWarning},
      {"UQW_BASE_UNKNOWN", Severity::kWarning},
      {"FORMATION_TOP_UNKNOWN", Severity::kWarning},
      {"EXISTING_CIBP_DEPTH_UNKNOWN", Severity::kWarning},

      // ---- Placement ----
      {"INSUFFICIENT_SHOE_COVERAGE", Severity::kError},
      {"BELOW_CIBP", Severity::kInfo},

      // ---- Materials ----
      {"MATERIALS_UNRESOLVED", Severity::kWarning},
      {"EXCESS_OUT_OF_RANGE", Severity::kWarning},

      // ---- Policy ----
      {"POLICY_INCOMPLETE", Severity::kError},
      {"MISSING_CITATION", Severity::kInfo},
  };
  return k;
}

} // namespace

const char* to_string(Severity s) noexcept {
  switch (s) {
    case Severity::kInfo: return "info";
    case Severity::kWarning: return "warning";
    case Severity::kError: return "error";
    case Severity::kCritical: return "critical";
    default: return "unknown";
  }
}

bool is_known_rule_id(std::string_view rule_id) {
  const auto& c = catalog();
  return c.find(rule_id) != c.end();
}

Severity severity_for_rule(std::string_view rule_id) {
  return catalog().find(rule_id)->second;
}

void ViolationLog::add(std::string_view rule_id, std::string message, std::string context) {
  PLUGPLAN_ENSURE(is_known_rule_id(rule_id), ErrorCode::kInvariant,
                  "unknown violation rule id: " + std::string(rule_id));

  std::string key(rule_id);
  key.push_back('|');
  key += context;
  if (seen_.find(key) != seen_.end()) return;
  seen_.insert(std::move(key));

  Violation v;
  v.severity = severity_for_rule(rule_id);
  v.rule_id = std::string(rule_id);
  v.message = std::move(message);
  v.context = std::move(context);
  items_.push_back(std::move(v));
}

void ViolationLog::append(const ViolationLog& other) {
  for (const Violation& v : other.items_) add(v.rule_id, v.message, v.context);
}

bool ViolationLog::contains(std::string_view rule_id) const {
  for (const Violation& v : items_) {
    if (v.rule_id == rule_id) return true;
  }
  return false;
}

bool ViolationLog::has_blocking() const {
  for (const Violation& v : items_) {
    if (v.severity == Severity::kError || v.severity == Severity::kCritical) return true;
  }
  return false;
}

} // namespace plugplan::plan

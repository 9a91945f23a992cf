#pragma once
/*
================================================================================
Fragment 9.1 — Exports: Plan / Policy JSON Serializer (Header)
FILE: cpp/engine/exports/plan_json.hpp

Purpose:
  - Deterministic JSON export of a compiled Plan and of an EffectivePolicy for
    the persistence / filing layers and for audit trails.
  - Optional values serialize as null; NaN is never emitted.

Hardening:
  - No third-party JSON dependency (simple, controlled emitter).
  - Fixed key order so two runs over the same inputs diff clean.
================================================================================
*/

#include <string>

#include "engine/core/value.hpp"
#include "engine/plan/plan_types.hpp"
#include "engine/policy/policy_resolver.hpp"

namespace plugplan::exports {

std::string value_to_json(const Value& v, int indent_spaces = 2);

std::string plan_to_json(const plan::Plan& p, int indent_spaces = 2);

std::string effective_policy_to_json(const policy::EffectivePolicy& p, int indent_spaces = 2);

// Returns false when the file cannot be opened or written.
bool write_text_file(const std::string& file_path, const std::string& content);

} // namespace plugplan::exports

#pragma once
/*
================================================================================
Fragment 6.1 — Plan: Generator Rules
FILE: cpp/engine/plan/rules.hpp

Purpose:
  - Each regulatory rule is a free function (context, state) -> state delta.
    Rules are composed in a fixed order by the step generator and can be
    called one at a time from tests.

Conventions:
  - Rules read knobs and the typed well profile only; they never touch the
    dynamic policy tree.
  - A policy knob always wins over the matching EngineSettings fallback.
  - Missing facts degrade into Violations; rules never throw for them.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/plan/step.hpp"
#include "engine/plan/violations.hpp"
#include "engine/plan/well_profile.hpp"
#include "engine/policy/policy_knobs.hpp"

namespace plugplan::plan {

struct RuleContext {
  const WellProfile& well;
  const policy::PolicyKnobs& knobs;
  const EngineSettings& settings;
};

struct GenerationState {
  std::vector<Step> steps;
  ViolationLog violations;
  std::vector<std::string> notes;

  bool has_type(StepType t) const;
  size_t count_type(StepType t) const;
  void add_note(std::string note);
};

using RuleFn = void (*)(const RuleContext&, GenerationState&);

struct NamedRule {
  const char* name;
  RuleFn fn;
};

// rules_scaffold.cpp
void rule_baseline_scaffold(const RuleContext& ctx, GenerationState& st);
void rule_policy_step_overrides(const RuleContext& ctx, GenerationState& st);

// rules_barriers.cpp
void rule_existing_cibp(const RuleContext& ctx, GenerationState& st);
void rule_new_cibp(const RuleContext& ctx, GenerationState& st);
void rule_device_isolation(const RuleContext& ctx, GenerationState& st);

// rules_squeeze.cpp
void rule_annular_gap_squeeze(const RuleContext& ctx, GenerationState& st);

// rules_formations.cpp
void rule_formation_tops(const RuleContext& ctx, GenerationState& st);
void rule_overlap_suppression(const RuleContext& ctx, GenerationState& st);

// rules_enrich.cpp
void rule_tagging(const RuleContext& ctx, GenerationState& st);
void rule_cement_class(const RuleContext& ctx, GenerationState& st);

// Compound squeeze step: squeeze over [lo, hi] plus a cap [hi, hi + cap_length].
// The context (open hole vs cased) is recorded in details.squeeze_context.
Step make_squeeze_step(const RuleContext& ctx, double lo_ft, double hi_ft);

// True when a perforation-type step sits at or below the existing CIBP.
bool below_existing_cibp(const RuleContext& ctx, double lo_ft);

// Tag on every step whose type the policy (or settings) lists.
bool step_type_requires_tag(const RuleContext& ctx, StepType t);

// Formats a step reference used in violation contexts: "type@lo-hi".
std::string step_ref(const Step& s);

} // namespace plugplan::plan

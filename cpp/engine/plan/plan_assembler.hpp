#pragma once
/*
================================================================================
Fragment 8.1 — Plan: Assembler
FILE: cpp/engine/plan/plan_assembler.hpp

Purpose:
  - Freeze generated steps into a Plan: order deepest first, assign step ids,
    sum materials, build filing rows, collect violations and notes.

Hardening:
  - Never aborts on per-well problems: an incomplete policy or a missing
    depth still yields a Plan (possibly a minimal scaffold) + violations.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/plan/plan_types.hpp"
#include "engine/plan/well_profile.hpp"
#include "engine/policy/policy_knobs.hpp"

namespace plugplan::plan {

struct AssemblyInput {
  const policy::EffectivePolicy& policy;
  const policy::PolicyKnobs& knobs;
  const WellProfile& well;
  std::vector<Step> steps;
  ViolationLog violations;
  std::vector<std::string> notes;
  std::string kernel_version;
  bool merge_applied = false;
  int merged_groups = 0;
};

// Filing-facing labels.
std::string mechanical_type_label(StepType t);
std::string regulatory_purpose(const Step& s);
std::vector<std::string> additional_operations(const Step& s);

std::vector<RrcExportRow> build_rrc_export(const std::vector<Step>& ordered_steps);

std::string plan_fingerprint(const Plan& plan);

Plan assemble_plan(AssemblyInput in);

} // namespace plugplan::plan

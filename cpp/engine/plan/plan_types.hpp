#pragma once
/*
================================================================================
Fragment 8.0 — Plan: Plan Data Model
FILE: cpp/engine/plan/plan_types.hpp

Purpose:
  - Root output of one compilation. A Plan is a value: edits produce a new
    Plan, never an in-place mutation of a returned one.

Ordering:
  - steps deepest first (sort key bottom_ft, or top_ft for point devices),
    step_id sequential from 1.
  - rrc_export rows follow step order.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/plan/step.hpp"
#include "engine/plan/violations.hpp"
#include "engine/policy/policy_resolver.hpp"

namespace plugplan::plan {

struct MaterialsTotals {
  std::optional<int> total_sacks;
  std::optional<double> total_bbl;  // rounded to 2 places
};

// One filing-form row.
struct RrcExportRow {
  std::optional<int> plug_no;  // empty for the casing cut
  int step_id = 0;
  std::string type;
  std::string mechanical_type;
  std::string regulatory_purpose;
  double from_ft = 0.0;  // bottom
  double to_ft = 0.0;    // top
  std::optional<int> sacks;
  std::string cement_class;
  std::optional<double> wait_hours;
  bool tag_required = false;
  std::optional<double> toc_ft;
  std::vector<std::string> additional_operations;
  std::string remarks;
};

struct Plan {
  std::string kernel_version;

  // policy identity
  std::string policy_id;
  std::string policy_version;
  std::string jurisdiction;
  std::string form;
  std::optional<std::string> district;
  std::optional<std::string> county;
  std::optional<std::string> field;
  policy::FieldResolution field_resolution;
  bool policy_complete = false;
  std::vector<std::string> incomplete_reasons;

  std::string api14;

  std::vector<Step> steps;
  std::vector<Violation> violations;
  MaterialsTotals materials_totals;
  std::vector<RrcExportRow> rrc_export;

  std::vector<std::string> formations_targeted;
  std::vector<std::string> formation_tops_detected;
  std::vector<std::string> plan_notes;
  std::vector<std::string> operational_instructions;

  bool long_plug_merge_applied = false;

  // 16 hex chars, FNV-1a over the plan content.
  std::string fingerprint;
};

} // namespace plugplan::plan

#pragma once
/*
================================================================================
Fragment 7.2 — Plan: Long-Plug Merge (optional)
FILE: cpp/engine/plan/merge_adjacent.hpp

Purpose:
  - Coalesce consecutive same-type steps whose gap is within a threshold into
    one plug spanning [min(bottom), max(top)].

Merged step:
  - regulatory_basis = union (first-seen order)
  - tag_required     = any source tagged
  - details.merged = true, details.merged_steps = [{formation, top_ft, bottom_ft}]
  - materials recomputed through the caller's callback
Never merges across differing step types, nor across a step that lies
between two candidates in depth order (a bridge plug, an override).
================================================================================
*/

#include <functional>
#include <string>
#include <vector>

#include "engine/plan/step.hpp"

namespace plugplan::plan {

struct MergeOptions {
  double threshold_ft = 500.0;
  std::vector<std::string> types = {"formation_top_plug"};

  // Called once per merged step after its interval is unified.
  std::function<void(Step&)> recompute;
};

struct MergeResult {
  std::vector<Step> steps;
  int merged_groups = 0;
  int steps_absorbed = 0;
};

MergeResult merge_adjacent(std::vector<Step> steps, const MergeOptions& opt);

} // namespace plugplan::plan

#pragma once
/*
================================================================================
Fragment 7.1 — Plan: Step Materials
FILE: cpp/engine/plan/step_materials.hpp

Purpose:
  - Bridge between generated steps and the pure materials engine: resolve the
    geometry and recipe for each cement-bearing step, compute sacks, and apply
    the minimum-sack floor.

Geometry precedence (per input):
  step override (details.geometry) > well facts > preferences.geometry_defaults
  Annular excess: step override > geometry default > preferences.annular_excess
  > settings.

Hardening:
  - Missing inputs leave sacks empty and raise MATERIALS_UNRESOLVED naming the
    input. Nothing is guessed except the flagged open-hole estimate.
================================================================================
*/

#include <vector>

#include "engine/plan/rules.hpp"

namespace plugplan::plan {

// Computes materials for one step in place (no-op for point devices and
// manual overrides).
void compute_step_materials(const RuleContext& ctx, Step& step, ViolationLog& violations);

void compute_materials(const RuleContext& ctx, std::vector<Step>& steps, ViolationLog& violations);

// Raises computed sacks below the floor to exactly the floor, recording
// details.texas_25_sack_minimum_applied and details.original_calculated_sacks.
// Exempt: bridge plugs, retainers, CIBP / bridge-plug caps, manual overrides.
// Returns the number of steps raised.
int apply_sack_floor(std::vector<Step>& steps, int floor_sacks);

} // namespace plugplan::plan

#pragma once
/*
================================================================================
Fragment 8.2 — Plan: Plan Compiler (Engine Entry Point)
FILE: cpp/engine/plan/plan_compiler.hpp

Pipeline:
  materialize knobs -> build well profile -> generate steps -> materials
  -> [long-plug merge + recompute] -> sack floor -> assemble

Contract:
  - Pure per invocation; identical (facts, policy, settings, options) inputs
    give byte-identical plans. Safe to run concurrently for different wells.
  - Throws only for invalid settings; per-well problems become violations.
================================================================================
*/

#include <optional>

#include "engine/core/settings.hpp"
#include "engine/plan/facts.hpp"
#include "engine/plan/plan_types.hpp"
#include "engine/policy/policy_resolver.hpp"

namespace plugplan::plan {

struct CompileOptions {
  // Overrides preferences.long_plug_merge.enabled when set.
  std::optional<bool> merge;
};

Plan compile_plan(const policy::EffectivePolicy& policy,
                  const WellFacts& facts,
                  const EngineSettings& settings,
                  const CompileOptions& options = {});

} // namespace plugplan::plan

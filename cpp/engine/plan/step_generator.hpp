#pragma once
/*
================================================================================
Fragment 6.0 — Plan: Step Generator
FILE: cpp/engine/plan/step_generator.hpp

Purpose:
  - Deterministic rule pipeline: (well profile, knobs, settings) -> unordered
    steps + violations + plan notes.

Fixed rule order:
   1) baseline scaffold           6) mechanical isolation (packer / DV tool)
   2) policy step overrides       7) formation-top plugs
   3) existing-CIBP gating        8) overlap suppression
   4) new-CIBP detector           9) tagging enrichment
   5) annular-gap squeeze        10) cement-class selection
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/plan/facts.hpp"
#include "engine/plan/rules.hpp"

namespace plugplan::plan {

struct GenerationResult {
  std::vector<Step> steps;
  ViolationLog violations;
  std::vector<std::string> notes;
};

const std::vector<NamedRule>& default_rule_pipeline();

GenerationResult generate_steps(const WellProfile& well,
                                const policy::PolicyKnobs& knobs,
                                const EngineSettings& settings);

GenerationResult generate_steps(const WellFacts& facts,
                                const policy::EffectivePolicy& policy,
                                const EngineSettings& settings);

} // namespace plugplan::plan

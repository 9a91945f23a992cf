#include "engine/plan/plan_compiler.hpp"

#include <utility>

#include "engine/core/logging.hpp"
#include "engine/plan/merge_adjacent.hpp"
#include "engine/plan/plan_assembler.hpp"
#include "engine/plan/step_generator.hpp"
#include "engine/plan/step_materials.hpp"

namespace plugplan::plan {

Plan compile_plan(const policy::EffectivePolicy& policy,
                  const WellFacts& facts,
                  const EngineSettings& settings,
                  const CompileOptions& options) {
  settings.validate_or_throw();

  const policy::PolicyKnobs knobs = policy::materialize_knobs(policy);
  const WellProfile well = build_well_profile(facts);
  const RuleContext ctx{well, knobs, settings};

  if (!policy.complete) {
    log(LogLevel::WARN, "compiling against incomplete policy " + policy.policy_id + " (" +
                            std::to_string(policy.incomplete_reasons.size()) + " missing keys)");
  }

  GenerationResult gen = generate_steps(well, knobs, settings);
  compute_materials(ctx, gen.steps, gen.violations);

  const bool merge = options.merge.value_or(knobs.merge.enabled);
  int merged_groups = 0;
  if (merge) {
    MergeOptions mo;
    mo.threshold_ft = knobs.merge.threshold_ft;
    mo.types = knobs.merge.types;
    mo.recompute = [&](Step& s) {
      s.cement_class = knobs.cement_class.pick(s.mid_ft());
      compute_step_materials(ctx, s, gen.violations);
    };
    MergeResult mr = merge_adjacent(std::move(gen.steps), mo);
    gen.steps = std::move(mr.steps);
    merged_groups = mr.merged_groups;
    log(LogLevel::DEBUG, "long-plug merge: " + std::to_string(mr.merged_groups) + " groups from " +
                             std::to_string(mr.steps_absorbed) + " steps");
  }

  const int raised = apply_sack_floor(gen.steps, materials::kMinimumPlugSacks);
  if (raised > 0) log(LogLevel::DEBUG, "sack floor raised " + std::to_string(raised) + " steps");

  AssemblyInput in{policy, knobs, well, std::move(gen.steps), std::move(gen.violations), std::move(gen.notes),
                   settings.kernel_version, merge, merged_groups};
  return assemble_plan(std::move(in));
}

} // namespace plugplan::plan

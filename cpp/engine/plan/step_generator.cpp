#include "engine/plan/step_generator.hpp"

#include <algorithm>
#include <utility>

#include "engine/core/logging.hpp"

namespace plugplan::plan {

bool GenerationState::has_type(StepType t) const {
  return count_type(t) > 0;
}

size_t GenerationState::count_type(StepType t) const {
  return static_cast<size_t>(
      std::count_if(steps.begin(), steps.end(), [t](const Step& s) { return s.type == t; }));
}

void GenerationState::add_note(std::string note) {
  if (std::find(notes.begin(), notes.end(), note) == notes.end()) notes.push_back(std::move(note));
}

std::string step_ref(const Step& s) {
  std::string out = to_string(s.type);
  out += "@" + format_number(s.lo_ft());
  if (s.bottom_ft) out += "-" + format_number(s.hi_ft());
  return out;
}

const std::vector<NamedRule>& default_rule_pipeline() {
  static const std::vector<NamedRule> k = {
      {"baseline_scaffold", &rule_baseline_scaffold},
      {"policy_step_overrides", &rule_policy_step_overrides},
      {"existing_cibp", &rule_existing_cibp},
      {"new_cibp", &rule_new_cibp},
      {"annular_gap_squeeze", &rule_annular_gap_squeeze},
      {"device_isolation", &rule_device_isolation},
      {"formation_tops", &rule_formation_tops},
      {"overlap_suppression", &rule_overlap_suppression},
      {"tagging", &rule_tagging},
      {"cement_class", &rule_cement_class},
  };
  return k;
}

GenerationResult generate_steps(const WellProfile& well,
                                const policy::PolicyKnobs& knobs,
                                const EngineSettings& settings) {
  const RuleContext ctx{well, knobs, settings};
  GenerationState st;

  for (const NamedRule& r : default_rule_pipeline()) {
    const size_t steps_before = st.steps.size();
    const size_t violations_before = st.violations.size();
    r.fn(ctx, st);
    log(LogLevel::DEBUG, std::string("rule ") + r.name + ": steps " + std::to_string(steps_before) + " -> " +
                             std::to_string(st.steps.size()) + ", violations +" +
                             std::to_string(st.violations.size() - violations_before));
  }

  GenerationResult out;
  out.steps = std::move(st.steps);
  out.violations = std::move(st.violations);
  out.notes = std::move(st.notes);
  return out;
}

GenerationResult generate_steps(const WellFacts& facts,
                                const policy::EffectivePolicy& policy,
                                const EngineSettings& settings) {
  const policy::PolicyKnobs knobs = policy::materialize_knobs(policy);
  const WellProfile well = build_well_profile(facts);
  return generate_steps(well, knobs, settings);
}

} // namespace plugplan::plan

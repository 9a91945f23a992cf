/*
================================================================================
Fragment 6.6 — Plan: Tagging + Cement-Class Enrichment
FILE: cpp/engine/plan/rules_enrich.cpp

Tagging sources (any one marks the step):
  - tag_required_step_types (policy knob, else settings)
  - overrides.tag.surface_shoe_in_oh            -> surface casing shoe plug
  - overrides.tagging_required_hint             -> surface shoe + UQW plugs
  - per-formation tag_required / tag.formations (set by the formation rule)
Tagged steps get details.verification = {action: "TAG", required_wait_hr}.
================================================================================
*/

#include <algorithm>
#include <string>

#include "engine/plan/rules.hpp"

namespace plugplan::plan {

bool step_type_requires_tag(const RuleContext& ctx, StepType t) {
  const std::vector<std::string>& types =
      ctx.knobs.tag_required_step_types ? *ctx.knobs.tag_required_step_types
                                        : ctx.settings.verification.tag_required_step_types;
  const std::string name = to_string(t);
  return std::find(types.begin(), types.end(), name) != types.end();
}

void rule_tagging(const RuleContext& ctx, GenerationState& st) {
  const policy::PolicyKnobs& k = ctx.knobs;
  const double wait_hr = k.number_or("tag_wait_hours", ctx.settings.verification.default_tag_wait_hr);

  for (Step& s : st.steps) {
    if (is_point_device(s.type)) continue;
    if (step_type_requires_tag(ctx, s.type)) s.tag_required = true;
    if (s.type == StepType::kSurfaceCasingShoePlug && (k.tag_surface_shoe_in_oh || k.tagging_required_hint)) {
      s.tag_required = true;
    }
    if (s.type == StepType::kUqwIsolationPlug && k.tagging_required_hint) s.tag_required = true;

    if (s.tag_required) {
      Value v = Value::map();
      v.set("action", Value::string("TAG"));
      v.set("required_wait_hr", Value::number(wait_hr));
      s.details.set("verification", std::move(v));
      s.add_basis(k.citations_for("tag_wait_hours"));
    }
  }
}

void rule_cement_class(const RuleContext& ctx, GenerationState& st) {
  for (Step& s : st.steps) {
    if (!is_cement_bearing(s.type) || !s.cement_class.empty()) continue;
    s.cement_class = ctx.knobs.cement_class.pick(s.mid_ft());
  }
}

} // namespace plugplan::plan

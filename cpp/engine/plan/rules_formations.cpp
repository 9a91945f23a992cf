/*
================================================================================
Fragment 6.5 — Plan: Formation-Top Plugs + Overlap Suppression
FILE: cpp/engine/plan/rules_formations.cpp

Formation tops:
  - One symmetric plug per overlay formation entry, centered on the top.
  - Top source: the well's own formation top, else the overlay's district
    anchor (top_ft), else FORMATION_TOP_UNKNOWN.
  - Regulatory basis "{policy_id}:{district}:formation_top:{formation}".

Overlap suppression:
  - Formation / cement plugs fully inside a squeeze or cap interval are
    dropped; the enclosing step already places that cement.
    Plugs carrying a manual materials override are kept.
================================================================================
*/

#include <algorithm>
#include <string>

#include "engine/core/logging.hpp"
#include "engine/plan/rules.hpp"

namespace plugplan::plan {

namespace {

bool is_container(StepType t) {
  return t == StepType::kPerforateAndSqueezePlug || is_cap(t);
}

bool is_suppressible(const Step& s) {
  return (s.type == StepType::kFormationTopPlug || s.type == StepType::kCementPlug) && !s.materials_override();
}

} // namespace

void rule_formation_tops(const RuleContext& ctx, GenerationState& st) {
  const policy::PolicyKnobs& k = ctx.knobs;
  const double half = k.number_or("formation_plug_half_ft", ctx.settings.lengths.formation_plug_half_ft);
  const std::string prefix = k.policy_id + ":" + k.district.value_or("");

  for (const policy::FormationRequirement& f : k.formation_tops) {
    if (!f.plug_required) continue;

    std::optional<double> top = ctx.well.formation_top(f.formation);
    const char* source = "well";
    if (!top && f.top_ft) {
      top = f.top_ft;
      source = "district_anchor";
    }
    if (!top) {
      st.violations.add("FORMATION_TOP_UNKNOWN",
                        "no top known for " + f.formation + "; formation plug not placed",
                        "formation:" + f.formation);
      continue;
    }

    Step s = make_interval_step(StepType::kFormationTopPlug, std::max(0.0, *top - half), *top + half);
    s.formation = f.formation;
    s.tag_required = f.tag_required || k.formation_tagged(f.formation);
    s.regulatory_basis.push_back(prefix + ":formation_top:" + f.formation);
    s.add_basis(k.citations_for("formation_plug_half_ft"));
    s.details.set("formation_top_ft", Value::number(*top));
    s.details.set("top_source", Value::string(source));
    st.steps.push_back(std::move(s));
  }
}

void rule_overlap_suppression(const RuleContext&, GenerationState& st) {
  std::vector<Step> containers;
  for (const Step& s : st.steps) {
    if (is_container(s.type)) containers.push_back(s);
  }
  if (containers.empty()) return;

  auto it = std::remove_if(st.steps.begin(), st.steps.end(), [&](const Step& s) {
    if (!is_suppressible(s)) return false;
    for (const Step& c : containers) {
      if (s.within(c)) {
        log(LogLevel::DEBUG, "suppressed " + step_ref(s) + " inside " + step_ref(c));
        return true;
      }
    }
    return false;
  });
  st.steps.erase(it, st.steps.end());
}

} // namespace plugplan::plan

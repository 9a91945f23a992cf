/*
================================================================================
Fragment 6.4 — Plan: Annular-Gap Perforate-and-Squeeze
FILE: cpp/engine/plan/rules_squeeze.cpp

Rule:
  - Every annular gap flagged requires_isolation=true, cement_present=false
    gets one compound perforate_and_squeeze_plug:
      squeeze  centered in the gap, length min(gap, squeeze_max_length_ft)
      cap      squeeze_cap_length_ft (default 50) on top of the squeeze
  - Context is open hole when the squeeze reaches below the production shoe
    and no liner covers it; cased otherwise (and when the shoe is unknown).
================================================================================
*/

#include <algorithm>
#include <string>

#include "engine/plan/rules.hpp"

namespace plugplan::plan {

namespace {

Value interval_value(double lo, double hi) {
  Value v = Value::map();
  v.set("bottom_ft", Value::number(lo));
  v.set("top_ft", Value::number(hi));
  return v;
}

} // namespace

Step make_squeeze_step(const RuleContext& ctx, double lo_ft, double hi_ft) {
  const WellProfile& w = ctx.well;
  const double lo = std::min(lo_ft, hi_ft);
  const double hi = std::max(lo_ft, hi_ft);
  const double cap_len = ctx.knobs.number_or("squeeze_cap_length_ft", ctx.settings.lengths.squeeze_cap_length_ft);

  const bool open_hole = w.production_shoe_ft && hi > *w.production_shoe_ft && !w.inside_liner(DepthRange{lo, hi});

  Step s = make_interval_step(StepType::kPerforateAndSqueezePlug, lo, hi + cap_len);
  s.add_basis(ctx.knobs.citations_for("squeeze_cap_length_ft"));
  s.details.set("squeeze_interval", interval_value(lo, hi));
  s.details.set("cap_interval", interval_value(hi, hi + cap_len));
  s.details.set("squeeze_length_ft", Value::number(hi - lo));
  s.details.set("cap_length_ft", Value::number(cap_len));
  s.details.set("squeeze_context", Value::string(open_hole ? "open_hole" : "cased_hole"));
  return s;
}

void rule_annular_gap_squeeze(const RuleContext& ctx, GenerationState& st) {
  const double max_len = ctx.knobs.number_or("squeeze_max_length_ft", ctx.settings.lengths.squeeze_max_length_ft);

  for (const AnnularGap& g : ctx.well.annular_gaps) {
    if (!g.requires_isolation || g.cement_present) continue;
    const double gap_len = g.range.length_ft();
    if (gap_len <= 0.0) continue;

    const double sq_len = std::min(gap_len, max_len);
    const double center = g.range.mid_ft();
    const double lo = center - sq_len / 2.0;
    const double hi = center + sq_len / 2.0;

    if (below_existing_cibp(ctx, lo)) {
      st.violations.add("BELOW_CIBP",
                        "annular gap " + format_number(g.range.shallow_ft) + "-" + format_number(g.range.deep_ft) +
                            " ft lies below the existing CIBP; squeeze not planned",
                        "annular_gap@" + format_number(g.range.shallow_ft) + "-" + format_number(g.range.deep_ft));
      continue;
    }

    Step s = make_squeeze_step(ctx, lo, hi);
    s.details.set("source", Value::string("annular_gap"));
    s.details.set("gap_interval", interval_value(g.range.shallow_ft, g.range.deep_ft));
    if (!g.description.empty()) s.details.set("gap_description", Value::string(g.description));
    st.steps.push_back(std::move(s));
  }
}

} // namespace plugplan::plan

/*
================================================================================
Fragment 6.2 — Plan: Baseline Scaffold + Policy Step Overrides
FILE: cpp/engine/plan/rules_scaffold.cpp

Scaffold (always attempted, each piece degrades on its own):
  - surface / intermediate casing shoe plugs centered on the shoe
  - usable-quality water isolation plug around the UQW base
  - productive-horizon isolation plug when the production shoe lies deeper
    than the producing top
  - top plug + casing cut below surface
================================================================================
*/

#include <algorithm>
#include <string>

#include "engine/core/logging.hpp"
#include "engine/plan/rules.hpp"

namespace plugplan::plan {

namespace {

Value interval_value(double lo, double hi) {
  Value v = Value::map();
  v.set("bottom_ft", Value::number(lo));
  v.set("top_ft", Value::number(hi));
  return v;
}

void set_geometry(Value& out, const policy::GeometryDefault& g) {
  if (g.casing_id_in) out.set("casing_id_in", Value::number(*g.casing_id_in));
  if (g.stinger_od_in) out.set("stinger_od_in", Value::number(*g.stinger_od_in));
  if (g.stinger_id_in) out.set("stinger_id_in", Value::number(*g.stinger_id_in));
  if (g.hole_d_in) out.set("hole_d_in", Value::number(*g.hole_d_in));
  if (g.annular_excess) out.set("annular_excess", Value::number(*g.annular_excess));
}

void add_shoe_plug(const RuleContext& ctx,
                   GenerationState& st,
                   StepType type,
                   double shoe_ft,
                   const char* length_knob) {
  const policy::PolicyKnobs& k = ctx.knobs;
  const auto coverage = k.knob("casing_shoe_coverage_ft");

  auto length = k.knob(length_knob).value;
  if (!length) length = coverage.value;
  const double len = length.value_or(ctx.settings.lengths.shoe_plug_min_ft);

  Step s = make_interval_step(type, std::max(0.0, shoe_ft - len / 2.0), shoe_ft + len / 2.0);
  s.add_basis(k.citations_for(length_knob));
  s.add_basis(coverage.citations);
  s.details.set("casing_shoe_ft", Value::number(shoe_ft));
  s.details.set("min_length_ft", Value::number(len));
  st.steps.push_back(std::move(s));

  if (coverage.value && len < *coverage.value) {
    st.violations.add("INSUFFICIENT_SHOE_COVERAGE",
                      std::string(to_string(type)) + " length " + format_number(len) +
                          " ft is below the required coverage of " + format_number(*coverage.value) + " ft",
                      std::string("requirements.") + length_knob);
  }
}

} // namespace

void rule_baseline_scaffold(const RuleContext& ctx, GenerationState& st) {
  const WellProfile& w = ctx.well;
  const policy::PolicyKnobs& k = ctx.knobs;
  const PlugLengthSettings& len = ctx.settings.lengths;

  // ---- Casing shoes ----
  if (w.surface_shoe_ft) {
    add_shoe_plug(ctx, st, StepType::kSurfaceCasingShoePlug, *w.surface_shoe_ft, "surface_casing_shoe_plug_min_ft");
  } else {
    st.violations.add("SURFACE_SHOE_DEPTH_UNKNOWN", "surface_shoe_ft is required to place the surface casing shoe plug",
                      "facts.surface_shoe_ft");
  }
  if (w.intermediate_shoe_ft) {
    add_shoe_plug(ctx, st, StepType::kIntermediateCasingShoePlug, *w.intermediate_shoe_ft,
                  "intermediate_casing_shoe_plug_min_ft");
  }

  // ---- Usable-quality water ----
  if (w.has_uqw) {
    if (!w.uqw_base_ft) {
      st.violations.add("UQW_BASE_UNKNOWN", "has_uqw is set but uqw_base_ft is missing; UQW isolation plug not placed",
                        "facts.uqw_base_ft");
    } else {
      double below = k.number_or("uqw_below_base_ft", len.uqw_below_base_ft);
      double above = k.number_or("uqw_above_base_ft", len.uqw_above_base_ft);
      const auto coverage = k.knob("duqw_coverage_ft");
      if (coverage.value && below + above < *coverage.value) {
        const double extra = (*coverage.value - (below + above)) / 2.0;
        below += extra;
        above += extra;
      }
      const double base = *w.uqw_base_ft;
      Step s = make_interval_step(StepType::kUqwIsolationPlug, std::max(0.0, base - below), base + above);
      s.add_basis(coverage.citations);
      s.add_basis(k.citations_for("uqw_below_base_ft"));
      s.add_basis(k.citations_for("uqw_above_base_ft"));
      s.details.set("uqw_base_ft", Value::number(base));
      s.details.set("below_ft", Value::number(below));
      s.details.set("above_ft", Value::number(above));
      st.steps.push_back(std::move(s));
    }
  }

  // ---- Productive horizon ----
  const auto producing = w.deepest_producing_interval();
  if (producing && w.production_shoe_ft && *w.production_shoe_ft > producing->shallow_ft) {
    const double half = k.number_or("productive_horizon_isolation_half_ft", len.productive_horizon_half_ft);
    const double top = producing->shallow_ft;
    Step s = make_interval_step(StepType::kProductiveHorizonIsolationPlug, std::max(0.0, top - half), top + half);
    s.add_basis(k.citations_for("productive_horizon_isolation_half_ft"));
    s.details.set("producing_top_ft", Value::number(top));
    s.details.set("production_shoe_ft", Value::number(*w.production_shoe_ft));
    st.steps.push_back(std::move(s));
  }

  // ---- Surface ----
  const double top_len = k.number_or("top_plug_length_ft", len.top_plug_length_ft);
  Step top = make_interval_step(StepType::kTopPlug, 0.0, top_len);
  top.add_basis(k.citations_for("top_plug_length_ft"));
  st.steps.push_back(std::move(top));

  const double cut_ft = k.number_or("casing_cut_below_surface_ft", len.casing_cut_below_surface_ft);
  Step cut = make_point_step(StepType::kCutCasingBelowSurface, cut_ft);
  cut.add_basis(k.citations_for("casing_cut_below_surface_ft"));
  st.steps.push_back(std::move(cut));
}

void rule_policy_step_overrides(const RuleContext& ctx, GenerationState& st) {
  const policy::PolicyKnobs& k = ctx.knobs;
  const std::string prefix = k.policy_id + ":" + k.district.value_or("");

  for (const policy::ProtectInterval& p : k.protect_intervals) {
    Step s = make_interval_step(StepType::kCementPlug, p.shallow_ft, p.deep_ft);
    s.regulatory_basis.push_back(prefix + ":protect_interval");
    s.details.set("source", Value::string("protect_interval"));
    if (!p.reason.empty()) s.details.set("reason", Value::string(p.reason));
    st.steps.push_back(std::move(s));
  }

  for (const policy::CementPlugOverride& c : k.cement_plugs) {
    Step s = make_interval_step(StepType::kCementPlug, c.shallow_ft, c.deep_ft);
    s.add_basis(c.citations);
    s.details.set("source", Value::string("steps_override"));
    if (!c.geometry_context.empty()) s.details.set("geometry_context", Value::string(c.geometry_context));
    if (!c.note.empty()) s.details.set("note", Value::string(c.note));
    Value geo = Value::map();
    set_geometry(geo, c.geometry);
    if (geo.size() > 0) s.details.set("geometry", std::move(geo));
    if (!c.segments.empty()) {
      Value segs = Value::list();
      for (const policy::PlugSegment& seg : c.segments) {
        Value v = interval_value(seg.shallow_ft, seg.deep_ft);
        set_geometry(v, seg.geometry);
        segs.push_back(std::move(v));
      }
      s.details.set("segments", std::move(segs));
    }
    if (c.displacement_margin_bbl) {
      s.details.set("displacement_margin_bbl", Value::number(*c.displacement_margin_bbl));
    }
    if (c.sacks) {
      s.sacks = *c.sacks;
      s.details.set("materials_override", Value::boolean(true));
    }
    st.steps.push_back(std::move(s));
  }

  for (const policy::PerfCirculateOverride& p : k.perf_circulate) {
    Step s = make_interval_step(StepType::kPerfCirculate, p.shallow_ft, p.deep_ft);
    s.add_basis(p.citations);
    s.details.set("source", Value::string("steps_override"));
    s.details.set("perforation_interval", interval_value(p.shallow_ft, p.deep_ft));
    st.steps.push_back(std::move(s));
  }

  if (k.squeeze_via_perf) {
    const policy::SqueezeOverride& sq = *k.squeeze_via_perf;
    Step s = make_squeeze_step(ctx, sq.shallow_ft, sq.deep_ft);
    s.add_basis(sq.citations);
    s.details.set("source", Value::string("steps_override"));
    if (sq.sacks_override) {
      s.sacks = *sq.sacks_override;
      s.details.set("materials_override", Value::boolean(true));
    }
    st.steps.push_back(std::move(s));
  }

  if (!k.protect_intervals.empty() || !k.cement_plugs.empty() || !k.perf_circulate.empty() || k.squeeze_via_perf) {
    log(LogLevel::DEBUG, "policy step overrides: " + std::to_string(k.protect_intervals.size()) +
                             " protect intervals, " + std::to_string(k.cement_plugs.size()) + " cement plugs, " +
                             std::to_string(k.perf_circulate.size()) + " perf/circulate");
  }
}

} // namespace plugplan::plan

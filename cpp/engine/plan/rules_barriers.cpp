/*
================================================================================
Fragment 6.3 — Plan: Mechanical Barrier Rules
FILE: cpp/engine/plan/rules_barriers.cpp

Rules:
  - existing CIBP gating: drop perforation-type work below the plug and
    make sure a cement cap sits on it (depth -> depth + cap_length_ft)
  - new CIBP detector: fixed placement, no heuristics
      producing_top = top of the producing interval with the deepest bottom
      perforation candidate = producing_top - bridge_plug_offset_ft
      KOP candidate         = kop_md_ft - kop_offset_ft
      emitted depth         = min(candidates)      ("shallowest wins")
  - packer / DV-tool isolation plugs (+/- half length)
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <string>

#include "engine/core/logging.hpp"
#include "engine/plan/rules.hpp"

namespace plugplan::plan {

namespace {

constexpr double kCapMatchToleranceFt = 1.0;

bool is_perforation_work(StepType t) {
  return t == StepType::kPerforateAndSqueezePlug || t == StepType::kPerfCirculate;
}

bool has_cap_at(const GenerationState& st, double depth_ft) {
  for (const Step& s : st.steps) {
    if (is_cap(s.type) && std::fabs(s.lo_ft() - depth_ft) <= kCapMatchToleranceFt) return true;
  }
  return false;
}

double cibp_cap_length(const RuleContext& ctx) {
  return ctx.knobs.number_or("cement_above_cibp_min_ft", ctx.settings.lengths.default_cibp_cap_ft);
}

void add_device_plug(const RuleContext& ctx, GenerationState& st, double depth_ft, const char* device) {
  for (const Step& s : st.steps) {
    if (is_cement_bearing(s.type) && s.spans(depth_ft)) {
      log(LogLevel::DEBUG, std::string(device) + " at " + format_number(depth_ft) + " ft already spanned by " +
                               step_ref(s));
      return;
    }
  }
  const double half = ctx.knobs.number_or("device_isolation_half_ft", ctx.settings.placement.device_isolation_half_ft);
  Step s = make_interval_step(StepType::kMechanicalIsolationPlug, std::max(0.0, depth_ft - half), depth_ft + half);
  s.add_basis(ctx.knobs.citations_for("device_isolation_half_ft"));
  s.details.set("device", Value::string(device));
  s.details.set("device_depth_ft", Value::number(depth_ft));
  st.steps.push_back(std::move(s));
}

} // namespace

bool below_existing_cibp(const RuleContext& ctx, double lo_ft) {
  const WellProfile& w = ctx.well;
  return w.has_barrier("CIBP") && w.existing_cibp_ft && lo_ft >= *w.existing_cibp_ft;
}

void rule_existing_cibp(const RuleContext& ctx, GenerationState& st) {
  const WellProfile& w = ctx.well;
  if (!w.has_barrier("CIBP")) return;
  if (!w.existing_cibp_ft) {
    st.violations.add("EXISTING_CIBP_DEPTH_UNKNOWN",
                      "existing_mechanical_barriers lists a CIBP but existing_cibp_ft is missing",
                      "facts.existing_cibp_ft");
    return;
  }
  const double cibp = *w.existing_cibp_ft;

  auto it = std::remove_if(st.steps.begin(), st.steps.end(), [&](const Step& s) {
    if (!is_perforation_work(s.type) || !below_existing_cibp(ctx, s.lo_ft())) return false;
    st.violations.add("BELOW_CIBP",
                      std::string(to_string(s.type)) + " below the existing CIBP at " + format_number(cibp) +
                          " ft was dropped",
                      step_ref(s));
    return true;
  });
  st.steps.erase(it, st.steps.end());

  if (!has_cap_at(st, cibp)) {
    const double cap_len = ctx.knobs.cibp_cap_length_ft.value_or(cibp_cap_length(ctx));
    Step cap = make_interval_step(StepType::kCibpCap, cibp, cibp + cap_len);
    cap.add_basis(ctx.knobs.citations_for("cement_above_cibp_min_ft"));
    cap.details.set("cibp_ft", Value::number(cibp));
    cap.details.set("cap_length_ft", Value::number(cap_len));
    cap.details.set("source", Value::string("existing_cibp"));
    st.steps.push_back(std::move(cap));
  }
  st.add_note("Existing CIBP at " + format_number(cibp) + " ft - tag and cap only; do not drill out.");
}

void rule_new_cibp(const RuleContext& ctx, GenerationState& st) {
  const WellProfile& w = ctx.well;
  const PlacementSettings& place = ctx.settings.placement;

  const auto producing = w.deepest_producing_interval();
  if (!producing) return;
  if (!w.production_shoe_ft) {
    if (!w.producing_intervals.empty()) {
      st.violations.add("PRODUCTION_SHOE_DEPTH_UNKNOWN",
                        "production_shoe_ft is required to decide whether the producing interval is exposed",
                        "facts.production_shoe_ft");
    }
    return;
  }

  const double shoe = *w.production_shoe_ft;
  const double producing_top = producing->shallow_ft;
  const bool exposed = producing_top >= shoe || producing->deep_ft >= shoe;
  if (!exposed) return;

  if (w.has_barrier("CIBP") && w.existing_cibp_ft && *w.existing_cibp_ft <= producing_top) {
    log(LogLevel::DEBUG, "new CIBP suppressed: existing CIBP at " + format_number(*w.existing_cibp_ft) + " ft");
    return;
  }
  for (const Step& s : st.steps) {
    if (is_perforation_work(s.type) && s.spans(producing_top)) {
      log(LogLevel::DEBUG, "new CIBP suppressed: producing top covered by " + step_ref(s));
      return;
    }
  }

  const double perf_candidate = producing_top - ctx.knobs.number_or("cibp_offset_above_perf_ft", place.bridge_plug_offset_ft);
  double depth = perf_candidate;
  std::string basis = "perforation";
  Value candidates = Value::map();
  candidates.set("perforation_ft", Value::number(perf_candidate));
  if (w.kop_md_ft) {
    const double kop_candidate = *w.kop_md_ft - ctx.knobs.number_or("cibp_offset_above_kop_ft", place.kop_offset_ft);
    candidates.set("kop_ft", Value::number(kop_candidate));
    if (kop_candidate < depth) {
      depth = kop_candidate;
      basis = "kop";
    }
  }

  const double cap_len = cibp_cap_length(ctx);
  const auto cites = ctx.knobs.citations_for("cement_above_cibp_min_ft");

  Step plug = make_point_step(StepType::kBridgePlug, depth);
  plug.add_basis(cites);
  plug.details.set("producing_top_ft", Value::number(producing_top));
  plug.details.set("production_shoe_ft", Value::number(shoe));
  plug.details.set("placement_basis", Value::string(basis));
  plug.details.set("candidate_depths", std::move(candidates));
  if (w.casing_id_in) {
    const double clearance = ctx.knobs.number_or("cibp_clearance_in", place.cibp_clearance_in);
    plug.details.set("recommended_cibp_od_in", Value::number(*w.casing_id_in - clearance));
  }

  Step cap = make_interval_step(StepType::kBridgePlugCap, depth, depth + cap_len);
  cap.add_basis(cites);
  cap.details.set("cibp_ft", Value::number(depth));
  cap.details.set("cap_length_ft", Value::number(cap_len));

  // The new CIBP + cap isolates the horizon; a balanced plug across it is redundant.
  auto it = std::remove_if(st.steps.begin(), st.steps.end(), [&](const Step& s) {
    return s.type == StepType::kProductiveHorizonIsolationPlug && s.spans(depth);
  });
  if (it != st.steps.end()) {
    st.steps.erase(it, st.steps.end());
    st.add_note("Productive horizon isolated by new CIBP at " + format_number(depth) + " ft with " +
                format_number(cap_len) + " ft cement cap.");
  }

  st.steps.push_back(std::move(plug));
  st.steps.push_back(std::move(cap));
}

void rule_device_isolation(const RuleContext& ctx, GenerationState& st) {
  const WellProfile& w = ctx.well;
  if (w.packer_ft) add_device_plug(ctx, st, *w.packer_ft, "packer");
  if (w.dv_tool_ft) {
    add_device_plug(ctx, st, *w.dv_tool_ft, "dv_tool");
    st.add_note("DV tool isolation considered at " + format_number(*w.dv_tool_ft) + " ft.");
  }
}

} // namespace plugplan::plan

#include "engine/plan/step_materials.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"

namespace plugplan::plan {

namespace {

constexpr double kExcessMin = 0.0;
constexpr double kExcessMax = 2.0;

std::optional<double> step_geometry(const Step& s, std::string_view key) {
  const Value* g = s.details.find("geometry");
  if (g == nullptr) return std::nullopt;
  const Value* v = g->find(key);
  return v ? v->number_or_none() : std::nullopt;
}

template <typename T>
std::optional<T> first_of(std::optional<T> a, std::optional<T> b, std::optional<T> c) {
  if (a) return a;
  if (b) return b;
  return c;
}

// details.segments: [{top_ft, bottom_ft, casing_id_in | hole_d_in, stinger_od_in, annular_excess}]
std::vector<materials::AnnulusSegment> segments_of(const Step& s) {
  std::vector<materials::AnnulusSegment> out;
  const Value* segs = s.details.find("segments");
  if (segs == nullptr || !segs->is_list()) return out;
  for (size_t i = 0; i < segs->size(); ++i) {
    const Value& e = segs->at(i);
    const auto number = [&e](std::string_view key) -> std::optional<double> {
      const Value* v = e.find(key);
      return v ? v->number_or_none() : std::nullopt;
    };
    const auto a = number("top_ft");
    const auto b = number("bottom_ft");
    if (!a || !b || *a == *b) continue;
    materials::AnnulusSegment seg;
    seg.lo_ft = std::min(*a, *b);
    seg.hi_ft = std::max(*a, *b);
    seg.outer_in = number("casing_id_in");
    if (!seg.outer_in) seg.outer_in = number("hole_d_in");
    seg.inner_in = number("stinger_od_in");
    seg.annular_excess = number("annular_excess");
    out.push_back(seg);
  }
  return out;
}

materials::PlugSpec plug_spec_for(const Step& s) {
  materials::PlugSpec spec;
  spec.depth_ft = s.hi_ft();
  if (is_cap(s.type)) {
    spec.kind = materials::PlugKind::kCap;
    spec.interval_ft = s.length_ft();
  } else if (s.type == StepType::kPerforateAndSqueezePlug) {
    spec.kind = materials::PlugKind::kSqueeze;
    const Value* sq = s.details.find("squeeze_length_ft");
    const Value* cap = s.details.find("cap_length_ft");
    spec.interval_ft = sq ? sq->number_or_none().value_or(0.0) : s.length_ft();
    spec.cap_length_ft = cap ? cap->number_or_none().value_or(0.0) : 0.0;
    const Value* ctx = s.details.find("squeeze_context");
    spec.open_hole = ctx != nullptr && ctx->text_or_empty() == "open_hole";
  } else {
    spec.kind = materials::PlugKind::kStandard;
    spec.interval_ft = s.length_ft();
    spec.segments = segments_of(s);
    if (const Value* m = s.details.find("displacement_margin_bbl")) {
      spec.displacement_margin_bbl = std::max(0.0, m->number_or_none().value_or(0.0));
    }
  }
  return spec;
}

} // namespace

void compute_step_materials(const RuleContext& ctx, Step& s, ViolationLog& violations) {
  if (!is_cement_bearing(s.type) || s.materials_override()) return;

  const WellProfile& w = ctx.well;
  const policy::GeometryDefault* gd = ctx.knobs.geometry_default_for(to_string(s.type));
  const policy::GeometryDefault none;
  if (gd == nullptr) gd = &none;

  materials::PlugGeometry geo;
  geo.casing_id_in = first_of(step_geometry(s, "casing_id_in"), w.casing_id_in, gd->casing_id_in);
  geo.stinger_od_in = first_of(step_geometry(s, "stinger_od_in"), w.stinger_od_in, gd->stinger_od_in);
  geo.hole_diameter_in = first_of(step_geometry(s, "hole_d_in"), w.hole_size_in, gd->hole_d_in);
  geo.stinger_id_in = first_of(step_geometry(s, "stinger_id_in"), w.stinger_id_in, gd->stinger_id_in);
  geo.annular_excess = first_of(step_geometry(s, "annular_excess"), gd->annular_excess, ctx.knobs.annular_excess)
                           .value_or(ctx.settings.materials.default_annular_excess);

  if (geo.annular_excess < kExcessMin || geo.annular_excess > kExcessMax) {
    violations.add("EXCESS_OUT_OF_RANGE",
                   "annular excess " + format_number(geo.annular_excess) + " outside [0, 2]; clamped",
                   step_ref(s));
    geo.annular_excess = geo.annular_excess < kExcessMin ? kExcessMin : kExcessMax;
  }

  materials::PlugSpec spec = plug_spec_for(s);
  if (spec.kind == materials::PlugKind::kSqueeze) spec.spacer = ctx.knobs.spacer;

  // Open-hole cement plug override: the hole is the outer wall.
  const Value* gctx = s.details.find("geometry_context");
  if (spec.kind == materials::PlugKind::kStandard && gctx != nullptr &&
      gctx->text_or_empty().rfind("open_hole", 0) == 0 && geo.hole_diameter_in) {
    geo.casing_id_in = geo.hole_diameter_in;
  }

  if (spec.kind == materials::PlugKind::kSqueeze) {
    Value g = Value::map();
    if (spec.open_hole) {
      if (!geo.hole_diameter_in && w.casing_od_in) {
        geo.hole_diameter_in = materials::estimate_open_hole_diameter_in(
            *w.casing_od_in, ctx.settings.materials.open_hole_diameter_add_in);
        g.set("context", Value::string("open_hole_estimated"));
      } else {
        g.set("context", Value::string("open_hole"));
      }
      if (geo.hole_diameter_in) g.set("hole_d_in", Value::number(*geo.hole_diameter_in));
    } else {
      g.set("context", Value::string("cased_hole"));
    }
    if (geo.casing_id_in) g.set("casing_id_in", Value::number(*geo.casing_id_in));
    if (geo.stinger_od_in) g.set("stinger_od_in", Value::number(*geo.stinger_od_in));
    g.set("squeeze_factor", Value::number(materials::squeeze_factor(spec.open_hole)));
    s.details.set("geometry_for_squeeze", std::move(g));
  }

  const materials::CementRecipe* recipe = ctx.knobs.recipe_for(s.cement_class);
  materials::MaterialsResult r = materials::compute_sacks(spec, geo, recipe);
  s.sacks = r.sacks;
  if (!r.sacks) {
    violations.add("MATERIALS_UNRESOLVED",
                   "sacks not computed for " + step_ref(s) + ": missing " + r.unavailable_reason, step_ref(s));
  }
  s.materials = std::move(r);
}

void compute_materials(const RuleContext& ctx, std::vector<Step>& steps, ViolationLog& violations) {
  int computed = 0;
  for (Step& s : steps) {
    compute_step_materials(ctx, s, violations);
    if (s.materials && s.materials->sacks) ++computed;
  }
  log(LogLevel::DEBUG, "materials computed for " + std::to_string(computed) + " of " + std::to_string(steps.size()) +
                           " steps");
}

int apply_sack_floor(std::vector<Step>& steps, int floor_sacks) {
  int raised = 0;
  for (Step& s : steps) {
    if (!is_cement_bearing(s.type) || is_sack_floor_exempt(s.type) || s.materials_override()) continue;
    if (!s.sacks || *s.sacks >= floor_sacks) continue;
    s.details.set("original_calculated_sacks", Value::number(*s.sacks));
    s.details.set("texas_25_sack_minimum_applied", Value::boolean(true));
    s.sacks = floor_sacks;
    ++raised;
  }
  return raised;
}

} // namespace plugplan::plan

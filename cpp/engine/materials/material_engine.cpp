/*
================================================================================
Fragment 4.2 — Materials: Capacity, Volume and Sack Math (Implementation)
FILE: cpp/engine/materials/material_engine.cpp
================================================================================
*/

#include "engine/materials/material_engine.hpp"

#include <algorithm>
#include <cmath>

#include "engine/core/error.hpp"
#include "engine/core/units.hpp"

namespace plugplan::materials {

double annular_capacity_bbl_per_ft(double d_outer_in, double d_inner_in) {
  PLUGPLAN_ENSURE(std::isfinite(d_outer_in) && d_outer_in > 0.0, ErrorCode::kInvalidArgument,
                  "annular capacity: outer diameter must be > 0");
  PLUGPLAN_ENSURE(std::isfinite(d_inner_in) && d_inner_in >= 0.0, ErrorCode::kInvalidArgument,
                  "annular capacity: inner diameter must be >= 0");
  const double delta = units::sqr(d_outer_in) - units::sqr(d_inner_in);
  if (delta <= 0.0) return 0.0;
  return (units::pi / 4.0) * delta / units::in2_ft_per_bbl;
}

double depth_scaled_excess(double excess, double depth_ft) {
  PLUGPLAN_ENSURE(excess >= 0.0, ErrorCode::kInvalidArgument, "excess must be >= 0");
  const double d = depth_ft > 0.0 ? depth_ft : 0.0;
  return excess * (1.0 + kExcessDepthScalePerKft * d / 1000.0);
}

double squeeze_factor(bool open_hole) noexcept {
  return open_hole ? kSqueezeFactorOpenHole : kSqueezeFactorCased;
}

int sacks_for_bbl(double total_bbl, double yield_ft3_per_sk) {
  PLUGPLAN_ENSURE(yield_ft3_per_sk > 0.0 && std::isfinite(yield_ft3_per_sk), ErrorCode::kInvalidArgument,
                  "yield_ft3_per_sk must be > 0");
  if (!(total_bbl > 0.0)) return 0;
  return static_cast<int>(std::ceil(total_bbl * units::ft3_per_bbl / yield_ft3_per_sk));
}

SlurrySummary summarize_slurry(int sacks, double total_bbl, const CementRecipe& recipe) {
  SlurrySummary s;
  s.recipe_id = recipe.id;
  s.cement_class = recipe.cement_class;
  s.density_ppg = recipe.density_ppg;
  s.yield_ft3_per_sk = recipe.yield_ft3_per_sk;
  s.sacks = sacks;
  s.total_bbl = total_bbl;
  s.ft3 = total_bbl * units::ft3_per_bbl;
  s.water_bbl = static_cast<double>(sacks) * recipe.water_gal_per_sk / units::gal_per_bbl;
  for (const Additive& a : recipe.additives) {
    s.additives.push_back({a.name, static_cast<double>(sacks) * a.rate_per_sack, a.unit});
  }
  return s;
}

double cylinder_capacity_bbl_per_ft(double d_in) {
  return annular_capacity_bbl_per_ft(d_in, 0.0);
}

double balanced_displacement_bbl(double interval_ft, double pipe_id_cap_bbl_per_ft, double margin_bbl) {
  PLUGPLAN_ENSURE(interval_ft >= 0.0 && pipe_id_cap_bbl_per_ft >= 0.0 && margin_bbl >= 0.0,
                  ErrorCode::kInvalidArgument, "displacement inputs must be >= 0");
  return interval_ft * pipe_id_cap_bbl_per_ft + margin_bbl;
}

double spacer_bbl_for_interval(double interval_ft, double annulus_cap_bbl_per_ft, const SpacerSpec& spec) {
  PLUGPLAN_ENSURE(interval_ft >= 0.0 && annulus_cap_bbl_per_ft >= 0.0 && spec.min_bbl >= 0.0 &&
                      spec.spacer_multiple >= 0.0,
                  ErrorCode::kInvalidArgument, "spacer inputs must be >= 0");
  double bbl = std::max(spec.min_bbl, spec.spacer_multiple * interval_ft * annulus_cap_bbl_per_ft);
  if (spec.contact_minutes && spec.pump_rate_bpm) {
    PLUGPLAN_ENSURE(*spec.contact_minutes >= 0.0 && *spec.pump_rate_bpm >= 0.0, ErrorCode::kInvalidArgument,
                    "spacer contact time and pump rate must be >= 0");
    bbl = std::max(bbl, *spec.contact_minutes * *spec.pump_rate_bpm);
  }
  return bbl;
}

std::vector<SegmentVolume> integrate_annulus_over_segments(const std::vector<AnnulusSegment>& segments,
                                                           double default_excess) {
  std::vector<SegmentVolume> out;
  out.reserve(segments.size());
  for (const AnnulusSegment& seg : segments) {
    PLUGPLAN_ENSURE(seg.hi_ft > seg.lo_ft, ErrorCode::kInvalidArgument, "segment must have positive length");
    PLUGPLAN_ENSURE(seg.outer_in.has_value() && seg.inner_in.has_value(), ErrorCode::kInvalidArgument,
                    "segment diameters must be resolved");
    SegmentVolume v;
    v.lo_ft = seg.lo_ft;
    v.hi_ft = seg.hi_ft;
    v.outer_in = *seg.outer_in;
    v.inner_in = *seg.inner_in;
    v.capacity_bbl_per_ft = annular_capacity_bbl_per_ft(v.outer_in, v.inner_in);
    v.excess_used = depth_scaled_excess(seg.annular_excess.value_or(default_excess), seg.hi_ft);
    v.bbl = v.length_ft() * v.capacity_bbl_per_ft * (1.0 + v.excess_used);
    out.push_back(v);
  }
  return out;
}

double estimate_open_hole_diameter_in(double casing_od_in, double add_in) noexcept {
  return casing_od_in + add_in;
}

SqueezeVolumes squeeze_volumes(double squeeze_ft,
                               double cap_ft,
                               double squeeze_cap_bbl_per_ft,
                               double cap_cap_bbl_per_ft,
                               bool open_hole) {
  PLUGPLAN_ENSURE(squeeze_ft >= 0.0 && cap_ft >= 0.0, ErrorCode::kInvalidArgument,
                  "squeeze and cap lengths must be >= 0");
  SqueezeVolumes v;
  v.squeeze_bbl = squeeze_ft * squeeze_cap_bbl_per_ft * squeeze_factor(open_hole);
  v.cap_bbl = cap_ft * cap_cap_bbl_per_ft * (1.0 + kCapExcess);
  return v;
}

namespace {

// Fills diameters the segment leaves unset from the step geometry; returns
// the name of the missing input, or "" when every segment is complete.
std::string resolve_segments(std::vector<AnnulusSegment>& segments, const PlugGeometry& geometry) {
  for (AnnulusSegment& seg : segments) {
    if (!seg.outer_in) seg.outer_in = geometry.casing_id_in;
    if (!seg.inner_in) seg.inner_in = geometry.stinger_od_in;
    if (!seg.outer_in || *seg.outer_in <= 0.0) return "casing_id_in";
    if (!seg.inner_in || *seg.inner_in < 0.0) return "stinger_od_in";
  }
  return {};
}

void segmented_volumes(const PlugSpec& spec, const PlugGeometry& geometry, MaterialsResult& r) {
  std::vector<AnnulusSegment> segments = spec.segments;
  r.unavailable_reason = resolve_segments(segments, geometry);
  if (!r.unavailable_reason.empty()) return;

  r.segments = integrate_annulus_over_segments(segments, geometry.annular_excess);
  double length = 0.0;
  double base_bbl = 0.0;
  for (const SegmentVolume& v : r.segments) {
    length += v.length_ft();
    base_bbl += v.length_ft() * v.capacity_bbl_per_ft;
    r.total_bbl += v.bbl;
  }
  // Length-weighted; per-segment excess lives in r.segments.
  r.annular_capacity_bbl_per_ft = length > 0.0 ? base_bbl / length : 0.0;
}

double plug_length_ft(const PlugSpec& spec) {
  if (spec.kind != PlugKind::kStandard || spec.segments.empty()) return spec.interval_ft;
  double length = 0.0;
  for (const AnnulusSegment& seg : spec.segments) length += seg.hi_ft - seg.lo_ft;
  return length;
}

} // namespace

MaterialsResult compute_sacks(const PlugSpec& spec, const PlugGeometry& geometry, const CementRecipe* recipe) {
  PLUGPLAN_ENSURE(spec.interval_ft >= 0.0 && spec.cap_length_ft >= 0.0, ErrorCode::kInvalidArgument,
                  "plug lengths must be >= 0");

  MaterialsResult r;
  if (spec.kind == PlugKind::kStandard && !spec.segments.empty()) {
    segmented_volumes(spec, geometry, r);
    if (!r.unavailable_reason.empty()) return r;
  } else {
    if (!geometry.casing_id_in || *geometry.casing_id_in <= 0.0) {
      r.unavailable_reason = "casing_id_in";
      return r;
    }
    if (!geometry.stinger_od_in || *geometry.stinger_od_in < 0.0) {
      r.unavailable_reason = "stinger_od_in";
      return r;
    }

    const double inner_cap = annular_capacity_bbl_per_ft(*geometry.casing_id_in, *geometry.stinger_od_in);

    switch (spec.kind) {
      case PlugKind::kStandard: {
        const double excess = depth_scaled_excess(geometry.annular_excess, spec.depth_ft);
        r.annular_capacity_bbl_per_ft = inner_cap;
        r.excess_used = excess;
        r.total_bbl = spec.interval_ft * inner_cap * (1.0 + excess);
        break;
      }
      case PlugKind::kCap: {
        r.annular_capacity_bbl_per_ft = inner_cap;
        r.excess_used = kCapExcess;
        r.cap_bbl = spec.interval_ft * inner_cap * (1.0 + kCapExcess);
        r.total_bbl = *r.cap_bbl;
        break;
      }
      case PlugKind::kSqueeze: {
        double outer = *geometry.casing_id_in;
        if (spec.open_hole) {
          if (!geometry.hole_diameter_in || *geometry.hole_diameter_in <= 0.0) {
            r.unavailable_reason = "hole_size_in";
            return r;
          }
          outer = *geometry.hole_diameter_in;
        }
        const double squeeze_cap = annular_capacity_bbl_per_ft(outer, *geometry.stinger_od_in);
        const SqueezeVolumes v =
            squeeze_volumes(spec.interval_ft, spec.cap_length_ft, squeeze_cap, inner_cap, spec.open_hole);
        r.annular_capacity_bbl_per_ft = squeeze_cap;
        r.excess_used = kCapExcess;
        r.squeeze_bbl = v.squeeze_bbl;
        r.cap_bbl = v.cap_bbl;
        r.total_bbl = v.total_bbl();
        break;
      }
    }
  }

  if (r.annular_capacity_bbl_per_ft <= 0.0) {
    r.unavailable_reason = "annulus";
    return r;
  }

  // Fluids
  const double length = plug_length_ft(spec);
  if (spec.kind == PlugKind::kStandard && geometry.stinger_id_in && *geometry.stinger_id_in > 0.0) {
    r.displacement_bbl = balanced_displacement_bbl(length, cylinder_capacity_bbl_per_ft(*geometry.stinger_id_in),
                                                   spec.displacement_margin_bbl);
  }
  if (spec.spacer) {
    r.spacer_bbl = spacer_bbl_for_interval(length, r.annular_capacity_bbl_per_ft, *spec.spacer);
  }

  if (recipe == nullptr || !recipe->usable()) {
    r.unavailable_reason = "recipe";
    return r;
  }

  const int sacks = sacks_for_bbl(r.total_bbl, recipe->yield_ft3_per_sk);
  r.sacks = sacks;
  r.slurry = summarize_slurry(sacks, r.total_bbl, *recipe);
  return r;
}

} // namespace plugplan::materials

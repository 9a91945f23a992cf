/*
  Fragment 4.3 — Materials Engine Selftest

  Covers capacity math, the squeeze/cap split, sack rounding, excess
  scaling, segmented annuli, displacement and spacer volumes, and the
  "no fabricated volumes" contract of compute_sacks().

  Expected use
  ------------
      ./materials_selftest
*/

#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/selftest.hpp"
#include "engine/materials/material_engine.hpp"

namespace plugplan::materials {
namespace {

using namespace selftest;

CementRecipe class_h() {
  CementRecipe r;
  r.id = "class_h_neat";
  r.cement_class = "H";
  r.density_ppg = 15.6;
  r.yield_ft3_per_sk = 1.19;
  r.water_gal_per_sk = 5.2;
  r.additives.push_back({"calcium_chloride", 2.0, "lb"});
  return r;
}

PlugGeometry cased_4_778() {
  PlugGeometry g;
  g.casing_id_in = 4.778;
  g.stinger_od_in = 2.375;
  g.annular_excess = 0.4;
  return g;
}

void test_capacity() {
  // pi/4 * (4.778^2 - 2.375^2) / 1029.4
  expect_near(annular_capacity_bbl_per_ft(4.778, 2.375), 0.013114, 1e-5, "capacity 4.778 x 2.375");
  expect_near(annular_capacity_bbl_per_ft(2.0, 2.375), 0.0, 0.0, "inner larger than outer -> 0");
  expect_throws<Error>([] { (void)annular_capacity_bbl_per_ft(0.0, 1.0); }, "zero outer diameter rejected");
}

void test_squeeze_split() {
  const SqueezeVolumes v = squeeze_volumes(100.0, 50.0, 0.025, 0.025, false);
  expect_near(v.squeeze_bbl, 3.75, 1e-9, "squeeze bbl = 100 x 0.025 x 1.5");
  expect_near(v.cap_bbl, 1.75, 1e-9, "cap bbl = 50 x 0.025 x 1.4");
  expect_near(v.total_bbl(), 5.5, 1e-9, "squeeze total");
  expect_eq_int(sacks_for_bbl(v.total_bbl(), 1.19), 26, "5.5 bbl at 1.19 ft3/sk -> 26 sacks");

  const SqueezeVolumes oh = squeeze_volumes(100.0, 0.0, 0.025, 0.025, true);
  expect_near(oh.squeeze_bbl, 5.0, 1e-9, "open-hole squeeze factor 2.0");

  expect_near(squeeze_factor(true), 2.0, 0.0, "open hole factor");
  expect_near(squeeze_factor(false), 1.5, 0.0, "cased hole factor");
  expect_throws<Error>([] { (void)squeeze_volumes(-1.0, 0.0, 0.01, 0.01, false); }, "negative squeeze length rejected");
}

void test_sack_rounding() {
  expect_eq_int(sacks_for_bbl(0.0, 1.19), 0, "zero volume -> zero sacks");
  // 1.0 bbl * 5.615 / 1.18 = 4.758...
  expect_eq_int(sacks_for_bbl(1.0, 1.18), 5, "fractional sacks round up");
  // Exactly 5.615 ft3 at 5.615 ft3/sk stays at one sack.
  expect_eq_int(sacks_for_bbl(1.0, 5.615), 1, "exact multiple is not bumped");
  expect_throws<Error>([] { (void)sacks_for_bbl(1.0, 0.0); }, "zero yield rejected");
}

void test_excess_scaling() {
  expect_near(depth_scaled_excess(0.4, 0.0), 0.4, 1e-12, "excess at surface");
  expect_near(depth_scaled_excess(0.4, 5000.0), 0.6, 1e-12, "+10% per 1000 ft, multiplicative");
  expect_near(depth_scaled_excess(0.4, -100.0), 0.4, 1e-12, "negative depth treated as surface");
}

void test_compute_sacks_standard() {
  PlugSpec spec;
  spec.kind = PlugKind::kStandard;
  spec.interval_ft = 100.0;
  spec.depth_ft = 5000.0;

  const CementRecipe h = class_h();
  const MaterialsResult r = compute_sacks(spec, cased_4_778(), &h);
  const double cap = annular_capacity_bbl_per_ft(4.778, 2.375);
  expect_near(r.total_bbl, 100.0 * cap * 1.6, 1e-9, "standard plug volume with depth-scaled excess");
  expect_near(r.excess_used, 0.6, 1e-12, "excess recorded");
  expect_true(r.sacks.has_value(), "standard plug has sacks");
  expect_eq_int(r.sacks.value_or(-1), sacks_for_bbl(r.total_bbl, 1.19), "sacks consistent with volume");
  expect_true(r.slurry.has_value() && r.slurry->recipe_id == "class_h_neat", "slurry summary carries recipe id");
  if (r.slurry) {
    expect_near(r.slurry->additives.at(0).amount, 2.0 * r.slurry->sacks, 1e-9, "additive total = rate x sacks");
  }
}

void test_compute_sacks_cap_and_squeeze() {
  const CementRecipe h = class_h();

  PlugSpec cap;
  cap.kind = PlugKind::kCap;
  cap.interval_ft = 20.0;
  const MaterialsResult rc = compute_sacks(cap, cased_4_778(), &h);
  expect_near(rc.cap_bbl, 20.0 * annular_capacity_bbl_per_ft(4.778, 2.375) * 1.4, 1e-9, "cap uses fixed 40% excess");

  PlugSpec sq;
  sq.kind = PlugKind::kSqueeze;
  sq.interval_ft = 100.0;
  sq.cap_length_ft = 50.0;
  sq.open_hole = true;
  const MaterialsResult missing_hole = compute_sacks(sq, cased_4_778(), &h);
  expect_true(!missing_hole.sacks.has_value(), "open-hole squeeze without hole size has no sacks");
  expect_eq_str(missing_hole.unavailable_reason, "hole_size_in", "reason names hole size");

  PlugGeometry g = cased_4_778();
  g.hole_diameter_in = 7.875;
  const MaterialsResult oh = compute_sacks(sq, g, &h);
  const double sq_cap = annular_capacity_bbl_per_ft(7.875, 2.375);
  expect_near(oh.squeeze_bbl, 100.0 * sq_cap * 2.0, 1e-9, "open-hole squeeze volume");
  expect_near(oh.total_bbl, *oh.squeeze_bbl + *oh.cap_bbl, 1e-12, "squeeze total = squeeze + cap");
}

void test_no_fabrication() {
  PlugSpec spec;
  spec.interval_ft = 100.0;
  const CementRecipe h = class_h();

  PlugGeometry no_id;
  no_id.stinger_od_in = 2.375;
  const MaterialsResult a = compute_sacks(spec, no_id, &h);
  expect_true(!a.sacks.has_value() && a.unavailable_reason == "casing_id_in", "missing casing id");

  PlugGeometry no_stinger;
  no_stinger.casing_id_in = 4.778;
  const MaterialsResult b = compute_sacks(spec, no_stinger, &h);
  expect_eq_str(b.unavailable_reason, "stinger_od_in", "missing stinger od");

  const MaterialsResult c = compute_sacks(spec, cased_4_778(), nullptr);
  expect_true(!c.sacks.has_value(), "no recipe -> no sacks");
  expect_eq_str(c.unavailable_reason, "recipe", "reason names recipe");
  expect_true(c.total_bbl > 0.0, "volume still reported without a recipe");
}


// Open hole at surface: 8.5 in hole over 0-40 ft, 10 in washout over 40-140 ft.
void test_segmented_plug() {
  std::vector<AnnulusSegment> segs(2);
  segs[0].lo_ft = 0.0;
  segs[0].hi_ft = 40.0;
  segs[0].outer_in = 8.5;
  segs[0].inner_in = 2.875;
  segs[0].annular_excess = 0.6;
  segs[1].lo_ft = 40.0;
  segs[1].hi_ft = 140.0;
  segs[1].outer_in = 10.0;
  segs[1].inner_in = 2.875;
  segs[1].annular_excess = 0.6;

  PlugSpec spec;
  spec.kind = PlugKind::kStandard;
  spec.interval_ft = 140.0;
  spec.depth_ft = 140.0;
  spec.segments = segs;

  CementRecipe h = class_h();
  h.yield_ft3_per_sk = 1.18;
  PlugGeometry g;  // every diameter comes from the segments
  g.annular_excess = 0.4;
  const MaterialsResult r = compute_sacks(spec, g, &h);

  expect_eq_int(static_cast<long long>(r.segments.size()), 2, "one volume per segment");
  if (r.segments.size() == 2) {
    expect_near(r.segments[0].capacity_bbl_per_ft, 0.048818, 1e-5, "8.5 x 2.875 capacity");
    expect_near(r.segments[1].capacity_bbl_per_ft, 0.069990, 1e-5, "10 x 2.875 capacity");
    expect_near(r.segments[0].excess_used, depth_scaled_excess(0.6, 40.0), 1e-12, "segment excess scaled at its depth");
    expect_near(r.segments[1].bbl, 100.0 * r.segments[1].capacity_bbl_per_ft * (1.0 + r.segments[1].excess_used),
                1e-9, "segment volume");
    expect_near(r.total_bbl, r.segments[0].bbl + r.segments[1].bbl, 1e-12, "total is the segment sum");
  }
  expect_near(r.total_bbl, 14.386, 0.01, "piecewise total bbl");
  expect_eq_int(r.sacks.value_or(-1), 69, "piecewise sacks at 1.18 ft3/sk");
  expect_true(!r.excess_used.has_value(), "no single excess on a segmented plug");

  PlugGeometry fallback;
  fallback.casing_id_in = 4.778;
  fallback.stinger_od_in = 2.375;
  PlugSpec partial = spec;
  partial.segments[0].outer_in.reset();
  const MaterialsResult rf = compute_sacks(partial, fallback, &h);
  expect_true(rf.segments.size() == 2 && rf.segments[0].outer_in == 4.778, "unset segment diameter falls back to casing");

  PlugSpec unresolved = spec;
  unresolved.segments[1].inner_in.reset();
  const MaterialsResult ru = compute_sacks(unresolved, g, &h);
  expect_true(!ru.sacks.has_value(), "segment without an inner diameter has no sacks");
  expect_eq_str(ru.unavailable_reason, "stinger_od_in", "reason names the stinger");

  std::vector<AnnulusSegment> inverted(1);
  inverted[0].lo_ft = 100.0;
  inverted[0].hi_ft = 50.0;
  inverted[0].outer_in = 8.5;
  inverted[0].inner_in = 2.875;
  expect_throws<Error>([&] { (void)integrate_annulus_over_segments(inverted, 0.4); }, "inverted segment rejected");
}

void test_fluids() {
  const double pipe_cap = cylinder_capacity_bbl_per_ft(2.441);
  expect_near(pipe_cap, 0.004546, 1e-5, "2.441 in pipe capacity");
  expect_near(balanced_displacement_bbl(140.0, pipe_cap, 2.0), 140.0 * pipe_cap + 2.0, 1e-12, "displacement + margin");
  expect_throws<Error>([&] { (void)balanced_displacement_bbl(-1.0, pipe_cap); }, "negative displacement length rejected");

  const double cap = annular_capacity_bbl_per_ft(4.778, 2.375);
  SpacerSpec sp;
  expect_near(spacer_bbl_for_interval(100.0, cap, sp), 5.0, 0.0, "small interval uses the spacer floor");
  sp.spacer_multiple = 10.0;
  expect_near(spacer_bbl_for_interval(100.0, cap, sp), 1000.0 * cap, 1e-9, "multiple of annular volume");
  sp.contact_minutes = 10.0;
  sp.pump_rate_bpm = 3.0;
  expect_near(spacer_bbl_for_interval(100.0, cap, sp), 30.0, 1e-12, "contact time x pump rate");

  PlugSpec spec;
  spec.kind = PlugKind::kStandard;
  spec.interval_ft = 100.0;
  spec.depth_ft = 5000.0;
  spec.displacement_margin_bbl = 1.0;
  PlugGeometry g = cased_4_778();
  g.stinger_id_in = 1.995;
  const CementRecipe h = class_h();
  const MaterialsResult r = compute_sacks(spec, g, &h);
  expect_near(r.displacement_bbl, 100.0 * cylinder_capacity_bbl_per_ft(1.995) + 1.0, 1e-9, "plug displacement");
  expect_true(!r.spacer_bbl.has_value(), "no spacer unless asked");

  PlugSpec sq;
  sq.kind = PlugKind::kSqueeze;
  sq.interval_ft = 100.0;
  sq.cap_length_ft = 50.0;
  sq.spacer = SpacerSpec{};
  const MaterialsResult rs = compute_sacks(sq, g, &h);
  expect_true(!rs.displacement_bbl.has_value(), "squeeze has no balanced-plug displacement");
  expect_near(rs.spacer_bbl, 5.0, 0.0, "squeeze spacer floor");
}

}  // namespace
}  // namespace plugplan::materials

int main() {
  using namespace plugplan::materials;

  test_capacity();
  test_squeeze_split();
  test_sack_rounding();
  test_excess_scaling();
  test_compute_sacks_standard();
  test_compute_sacks_cap_and_squeeze();
  test_no_fabrication();
  test_segmented_plug();
  test_fluids();

  return plugplan::selftest::exit_code("materials_selftest");
}

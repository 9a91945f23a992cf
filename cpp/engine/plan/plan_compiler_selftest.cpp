/*
  Fragment 8.3 — Plan Compiler Selftest

  Compiles the sample Andrews County well against the sample tx.w3a pack and
  checks the assembled plan: ordering, ids, the sack floor, filing rows, the
  JSON/CSV exports, determinism, and the policy-level violations. Inline
  wells cover squeeze context, perf/circulate and segmented plugs.

  Expected use
  ------------
      ./plan_compiler_selftest
  Reads the pack from PLUGPLAN_TEST_PACK_DIR and the sample facts from
  PLUGPLAN_TEST_SAMPLES_DIR.
*/

#include <algorithm>
#include <sstream>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/yaml_value.hpp"
#include "engine/exports/plan_json.hpp"
#include "engine/exports/rrc_export_csv.hpp"
#include "engine/materials/material_engine.hpp"
#include "engine/plan/plan_compiler.hpp"
#include "engine/policy/geo.hpp"
#include "engine/policy/policy_pack.hpp"

#ifndef PLUGPLAN_TEST_PACK_DIR
#define PLUGPLAN_TEST_PACK_DIR "policy_packs/tx/w3a"
#endif
#ifndef PLUGPLAN_TEST_SAMPLES_DIR
#define PLUGPLAN_TEST_SAMPLES_DIR "policy_packs/samples"
#endif

namespace plugplan::plan {
namespace {

using namespace selftest;

struct Fixture {
  policy::EffectivePolicy policy;
  WellFacts facts;
  EngineSettings settings;
};

Fixture andrews_fixture() {
  const std::string pack_dir = PLUGPLAN_TEST_PACK_DIR;
  const std::string samples = PLUGPLAN_TEST_SAMPLES_DIR;
  const policy::PolicyPack pack = policy::load_policy_pack(pack_dir + "/base.yaml");
  const policy::CentroidTable centroids =
      policy::CentroidTable::load_json_file(pack_dir + "/county_centroids.json");

  Fixture f;
  f.facts = WellFacts::load_file(samples + "/andrews_spraberry_facts.yaml");
  f.policy = policy::resolve(pack, centroids,
                             {f.facts.text("district"), f.facts.text("county"), f.facts.text("field")});
  f.settings = load_engine_settings(samples + "/engine_settings.yaml");
  return f;
}

bool has_violation(const Plan& p, const std::string& rule_id, const std::string& context = {}) {
  return std::any_of(p.violations.begin(), p.violations.end(), [&](const Violation& v) {
    return v.rule_id == rule_id && (context.empty() || v.context == context);
  });
}

void test_ordering_and_ids(const Plan& p) {
  expect_true(!p.steps.empty(), "plan has steps");
  expect_true(p.policy_complete, "sample policy complete");
  expect_eq_str(p.api14, "42003412340000", "api14 carried from facts");

  bool ids_ok = true;
  bool ordered = true;
  for (size_t i = 0; i < p.steps.size(); ++i) {
    if (p.steps[i].step_id != static_cast<int>(i) + 1) ids_ok = false;
    if (i > 0 && p.steps[i - 1].depth_key() < p.steps[i].depth_key()) ordered = false;
  }
  expect_true(ids_ok, "step ids sequential from 1");
  expect_true(ordered, "steps deepest first");

  const bool has_top = std::any_of(p.steps.begin(), p.steps.end(),
                                   [](const Step& s) { return s.type == StepType::kTopPlug; });
  expect_true(has_top, "surface plug always present");
}

void test_sack_floor(const Plan& p) {
  int floored = 0;
  for (const Step& s : p.steps) {
    const Value* orig = s.details.find("original_calculated_sacks");
    if (orig == nullptr) continue;
    ++floored;
    expect_true(!is_sack_floor_exempt(s.type), "floor never applied to caps or devices");
    expect_eq_int(s.sacks.value_or(-1), 25, "floored step carries 25 sacks");
    expect_true(orig->number_or_none().value_or(99) < 25, "original calculation recorded below the floor");
  }
  // A 100 ft shoe plug in 4.778 in casing is well under 25 sacks.
  expect_true(floored > 0, "sack floor applied at least once");

  for (const Step& s : p.steps) {
    if (!is_cement_bearing(s.type) || is_sack_floor_exempt(s.type) || !s.sacks) continue;
    expect_true(*s.sacks >= 25, std::string("sack floor holds for ") + to_string(s.type));
  }
}

void test_rrc_rows(const Plan& p) {
  expect_eq_int(static_cast<long long>(p.rrc_export.size()), static_cast<long long>(p.steps.size()),
                "one filing row per step");
  for (size_t i = 0; i < p.rrc_export.size() && i < p.steps.size(); ++i) {
    const RrcExportRow& r = p.rrc_export[i];
    const Step& s = p.steps[i];
    if (r.step_id != s.step_id) fail("rrc row out of step order");
    if (s.type == StepType::kCutCasingBelowSurface) {
      expect_true(!r.plug_no.has_value(), "casing cut has no plug number");
    }
    if (is_cement_bearing(s.type)) {
      expect_near(r.toc_ft, s.hi_ft(), 0.0, "toc equals top of plug");
    }
    if (r.from_ft > r.to_ft) fail("rrc row from_ft above to_ft");
  }

  const std::string csv = exports::rrc_export_to_csv(p);
  std::istringstream in(csv);
  std::string line;
  int lines = 0;
  std::string header;
  while (std::getline(in, line)) {
    if (lines == 0) header = line;
    ++lines;
  }
  expect_eq_int(lines, static_cast<long long>(p.rrc_export.size()) + 1, "csv: header + one line per row");
  expect_true(header.rfind("plug_no,step_id,type", 0) == 0, "csv: stable column order");
}

void test_determinism(const Fixture& f, const Plan& p) {
  const Plan again = compile_plan(f.policy, f.facts, f.settings);
  expect_eq_str(again.fingerprint, p.fingerprint, "fingerprint stable across runs");
  expect_eq_int(static_cast<long long>(p.fingerprint.size()), 16, "fingerprint is 16 hex chars");

  const std::string a = exports::plan_to_json(p);
  const std::string b = exports::plan_to_json(again);
  expect_eq_str(a, b, "json byte-identical across runs");
  expect_true(a.find("\"fingerprint\": \"" + p.fingerprint + "\"") != std::string::npos, "json carries fingerprint");
  expect_true(a.find(": nan") == std::string::npos, "json has no NaN");
}

void test_merge_option(const Fixture& f) {
  CompileOptions off;
  off.merge = false;
  const Plan unmerged = compile_plan(f.policy, f.facts, f.settings, off);
  expect_true(!unmerged.long_plug_merge_applied, "merge forced off");

  CompileOptions on;
  on.merge = true;
  const Plan merged = compile_plan(f.policy, f.facts, f.settings, on);
  expect_true(merged.long_plug_merge_applied, "merge forced on");
  expect_true(merged.steps.size() <= unmerged.steps.size(), "merge never adds steps");
  if (merged.steps.size() < unmerged.steps.size()) {
    expect_true(merged.fingerprint != unmerged.fingerprint, "merged plan fingerprints differently");
  }
}

void test_policy_violations() {
  const char* bare =
      "policy_id: tx.w3a\n"
      "version: bare\n"
      "base:\n"
      "  requirements: {top_plug_length_ft: 10}\n";
  const policy::PolicyPack pack = policy::policy_pack_from_documents(bare, {}, "bare");
  const policy::EffectivePolicy pol = policy::resolve(pack, policy::CentroidTable{}, {});

  WellFacts facts;
  facts.set_value("surface_shoe_ft", Value::number(1210));
  const Plan p = compile_plan(pol, facts, EngineSettings{});

  expect_true(!p.policy_complete, "bare pack is incomplete");
  expect_true(has_violation(p, "POLICY_INCOMPLETE", "policy"), "incomplete policy reported once, on the policy");
  expect_true(has_violation(p, "MISSING_CITATION"), "uncited steps reported");
  expect_true(!p.steps.empty(), "a scaffold plan is still produced");

  EngineSettings bad;
  bad.kernel_version.clear();
  expect_throws<Error>([&] { (void)compile_plan(pol, facts, bad); }, "invalid settings rejected");
}


const Step* find_step(const Plan& p, StepType t) {
  auto it = std::find_if(p.steps.begin(), p.steps.end(), [t](const Step& s) { return s.type == t; });
  return it == p.steps.end() ? nullptr : &*it;
}

std::string detail_text(const Value& details, const char* key) {
  const Value* v = details.find(key);
  return v ? v->text_or_empty() : std::string();
}

// Annular-gap squeeze below the production shoe: open hole unless a liner covers it.
void test_squeeze_context(const Fixture& f) {
  const WellFacts open_facts = WellFacts::from_value(parse_yaml_text(
      "production_shoe_ft: 5000\n"
      "casing_id_in: 4.778\n"
      "casing_od_in: 5.5\n"
      "stinger_od_in: 2.375\n"
      "annular_gaps:\n"
      "  - {top_ft: 5400, bottom_ft: 5500, requires_isolation: true}\n",
      "facts"));
  const Plan open = compile_plan(f.policy, open_facts, f.settings);
  const Step* sq = find_step(open, StepType::kPerforateAndSqueezePlug);
  expect_true(sq != nullptr, "squeeze planned for the open-hole gap");
  if (sq) {
    expect_eq_str(detail_text(sq->details, "squeeze_context"), "open_hole", "gap below shoe is open hole");
    const Value* g = sq->details.find("geometry_for_squeeze");
    expect_true(g != nullptr, "squeeze geometry recorded");
    if (g) {
      expect_eq_str(detail_text(*g, "context"), "open_hole_estimated", "hole size estimated from casing OD");
      const double hole = 5.5 + f.settings.materials.open_hole_diameter_add_in;
      expect_near(g->find("hole_d_in")->number_or_none(), hole, 1e-12, "estimated hole diameter");
      expect_near(g->find("squeeze_factor")->number_or_none(), 2.0, 0.0, "open-hole squeeze factor");
      if (sq->materials) {
        expect_near(sq->materials->squeeze_bbl, 100.0 * materials::annular_capacity_bbl_per_ft(hole, 2.375) * 2.0,
                    1e-9, "open-hole squeeze volume");
      }
    }
    expect_true(sq->sacks.has_value(), "open-hole squeeze has sacks");
  }

  const WellFacts lined_facts = WellFacts::from_value(parse_yaml_text(
      "production_shoe_ft: 5000\n"
      "casing_id_in: 4.778\n"
      "casing_od_in: 5.5\n"
      "stinger_od_in: 2.375\n"
      "liner_intervals: [[5550, 5800]]\n"
      "annular_gaps:\n"
      "  - {top_ft: 5600, bottom_ft: 5700, requires_isolation: true}\n",
      "facts"));
  const Plan lined = compile_plan(f.policy, lined_facts, f.settings);
  const Step* lsq = find_step(lined, StepType::kPerforateAndSqueezePlug);
  expect_true(lsq != nullptr, "squeeze planned for the lined gap");
  if (lsq) {
    expect_eq_str(detail_text(lsq->details, "squeeze_context"), "cased_hole", "liner makes the gap cased");
    const Value* g = lsq->details.find("geometry_for_squeeze");
    if (g) {
      expect_eq_str(detail_text(*g, "context"), "cased_hole", "cased squeeze geometry");
      expect_near(g->find("squeeze_factor")->number_or_none(), 1.5, 0.0, "cased squeeze factor");
      expect_true(g->find("hole_d_in") == nullptr, "no hole diameter on a cased squeeze");
    } else {
      fail("cased squeeze geometry missing");
    }
  }
}

// perf_circulate opens a circulation path only; it carries no cement.
void test_perf_circulate_is_operational(const Fixture& f) {
  const std::string pack_dir = PLUGPLAN_TEST_PACK_DIR;
  const policy::PolicyPack pack = policy::load_policy_pack(pack_dir + "/base.yaml");
  const policy::CentroidTable centroids =
      policy::CentroidTable::load_json_file(pack_dir + "/county_centroids.json");
  const policy::EffectivePolicy fullerton = policy::resolve(pack, centroids, {"08A", "Andrews", "Fullerton"});
  const Plan p = compile_plan(fullerton, f.facts, f.settings);

  expect_true(!is_cement_bearing(StepType::kPerfCirculate), "perf_circulate is not cement-bearing");
  const Step* pc = find_step(p, StepType::kPerfCirculate);
  expect_true(pc != nullptr, "field override places perf_circulate");
  if (!pc) return;
  expect_true(!pc->sacks.has_value(), "no sacks on perf_circulate");
  expect_true(!pc->materials.has_value(), "no materials on perf_circulate");
  expect_true(pc->cement_class.empty(), "no cement class on perf_circulate");
  expect_true(pc->details.find("texas_25_sack_minimum_applied") == nullptr, "sack floor skips perf_circulate");

  long long sum = 0;
  for (const Step& s : p.steps) sum += s.sacks.value_or(0);
  expect_eq_int(p.materials_totals.total_sacks.value_or(0), sum, "totals sum cement steps only");

  for (const RrcExportRow& r : p.rrc_export) {
    if (r.step_id != pc->step_id) continue;
    expect_true(!r.toc_ft.has_value(), "no top of cement on perf_circulate row");
    expect_true(!r.sacks.has_value(), "no sacks on perf_circulate row");
  }
}

const char* kSegmentPackYaml =
    "policy_id: tx.w3a\n"
    "version: segments\n"
    "base:\n"
    "  requirements: {top_plug_length_ft: 10}\n"
    "  cement_class: {cutoff_ft: 4000, shallow_class: C, deep_class: H}\n"
    "  preferences:\n"
    "    annular_excess: 0.4\n"
    "    spacer: {min_bbl: 5, spacer_multiple: 1.5}\n"
    "    recipes:\n"
    "      C: {id: class_c_neat, class: C, density_ppg: 14.8, yield_ft3_per_sk: 1.32, water_gal_per_sk: 6.3}\n"
    "      H: {id: class_h_neat, class: H, density_ppg: 15.6, yield_ft3_per_sk: 1.18, water_gal_per_sk: 5.2}\n"
    "  steps_overrides:\n"
    "    cement_plugs:\n"
    "      - top_ft: 1150\n"
    "        bottom_ft: 1300\n"
    "        geometry_context: open_hole\n"
    "        stinger_od_in: 2.875\n"
    "        stinger_id_in: 2.441\n"
    "        displacement_margin_bbl: 2\n"
    "        citations: [manual]\n"
    "        segments:\n"
    "          - {top_ft: 1150, bottom_ft: 1210, casing_id_in: 8.097}\n"
    "          - {top_ft: 1210, bottom_ft: 1300, hole_d_in: 11.0}\n";

// A cement plug straddling the surface shoe: casing above, open hole below.
void test_segmented_override_plug() {
  const policy::PolicyPack pack = policy::policy_pack_from_documents(kSegmentPackYaml, {}, "segments");
  const policy::EffectivePolicy pol = policy::resolve(pack, policy::CentroidTable{}, {});
  const WellFacts facts = WellFacts::from_value(parse_yaml_text(
      "surface_shoe_ft: 1210\n"
      "casing_id_in: 4.778\n"
      "stinger_od_in: 2.375\n"
      "annular_gaps:\n"
      "  - {top_ft: 2800, bottom_ft: 2900, requires_isolation: true}\n",
      "facts"));
  const Plan p = compile_plan(pol, facts, EngineSettings{});

  const Step* plug = nullptr;
  for (const Step& s : p.steps) {
    if (s.type == StepType::kCementPlug && s.details.find("segments") != nullptr) plug = &s;
  }
  expect_true(plug != nullptr, "segmented override plug placed");
  if (!plug || !plug->materials) {
    fail("segmented plug has no materials");
    return;
  }
  const materials::MaterialsResult& m = *plug->materials;
  expect_eq_int(static_cast<long long>(m.segments.size()), 2, "two annulus segments");
  if (m.segments.size() == 2) {
    const materials::SegmentVolume& deep = m.segments[0].lo_ft > m.segments[1].lo_ft ? m.segments[0] : m.segments[1];
    const materials::SegmentVolume& shallow = &deep == &m.segments[0] ? m.segments[1] : m.segments[0];
    expect_near(shallow.outer_in, 8.097, 0.0, "cased segment uses casing id");
    expect_near(deep.outer_in, 11.0, 0.0, "open-hole segment uses hole diameter");
    expect_near(deep.inner_in, 2.875, 0.0, "step stinger fills the segment inner diameter");
    expect_near(m.total_bbl, shallow.bbl + deep.bbl, 1e-9, "plug volume is the segment sum");
  }
  expect_eq_str(plug->cement_class, "C", "shallow plug takes the shallow class");
  expect_eq_int(plug->sacks.value_or(-1), materials::sacks_for_bbl(m.total_bbl, 1.32), "sacks from segment volume");
  expect_near(m.displacement_bbl, 150.0 * materials::cylinder_capacity_bbl_per_ft(2.441) + 2.0, 1e-9,
              "displacement through the work string plus margin");

  const Step* sq = find_step(p, StepType::kPerforateAndSqueezePlug);
  expect_true(sq != nullptr && sq->materials.has_value(), "squeeze planned with materials");
  if (sq && sq->materials) {
    expect_true(sq->materials->spacer_bbl.value_or(0.0) >= 5.0, "squeeze spacer at least the floor");
  }

  const std::string json = exports::plan_to_json(p);
  expect_true(json.find("\"segments\": [") != std::string::npos, "json carries segment breakdown");
  expect_true(json.find("\"displacement_bbl\": ") != std::string::npos, "json carries fluids");
}

}  // namespace
}  // namespace plugplan::plan

int main() {
  using namespace plugplan;
  set_log_level(LogLevel::ERROR);

  try {
    const plan::Fixture f = plan::andrews_fixture();
    const plan::Plan p = plan::compile_plan(f.policy, f.facts, f.settings);
    plan::test_ordering_and_ids(p);
    plan::test_sack_floor(p);
    plan::test_rrc_rows(p);
    plan::test_determinism(f, p);
    plan::test_merge_option(f);
    plan::test_policy_violations();
    plan::test_squeeze_context(f);
    plan::test_perf_circulate_is_operational(f);
    plan::test_segmented_override_plug();
  } catch (const Error& e) {
    selftest::fail(std::string("unexpected error: ") + e.what());
  }

  return selftest::exit_code("plan_compiler_selftest");
}

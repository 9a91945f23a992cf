/*
  Fragment 6.8 — Step Generator Selftest

  Scenario checks for the rule pipeline:
    1) New CIBP above an exposed producing interval, with cap.
    2) KOP candidate shallower than the perforation candidate.
    3) Existing CIBP: tag-and-cap, perforation work below it dropped.
    4) Annular-gap squeeze, formation plugs, overlap suppression, tagging.
    5) Missing facts degrade into violations, never exceptions.
    6) Shoe / UQW coverage and device isolation.

  Expected use
  ------------
      ./step_generator_selftest
*/

#include <algorithm>
#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/yaml_value.hpp"
#include "engine/plan/step_generator.hpp"
#include "engine/policy/policy_pack.hpp"
#include "engine/policy/policy_resolver.hpp"

namespace plugplan::plan {
namespace {

using namespace selftest;

const char* kBaseYaml =
    "policy_id: tx.w3a\n"
    "version: gen-test\n"
    "base:\n"
    "  citations:\n"
    "    tac_g2: {cite: \"16 TAC 3.14(g)(2)\"}\n"
    "    tac_d11: {cite: \"16 TAC 3.14(d)(11)\"}\n"
    "  requirements:\n"
    "    casing_shoe_coverage_ft: 100\n"
    "    duqw_coverage_ft: 100\n"
    "    tag_wait_hours: {value: 4, citation_keys: [tac_d11]}\n"
    "    cement_above_cibp_min_ft: {value: 20, citation_keys: [tac_g2]}\n"
    "  cement_class: {cutoff_ft: 4000, shallow_class: C, deep_class: H}\n";

const char* kDistrictYaml =
    "overrides:\n"
    "  tag: {surface_shoe_in_oh: true}\n"
    "  formation_tops:\n"
    "    - {formation: San Andres}\n"
    "    - {formation: Clearfork, top_ft: 6200, tag_required: true}\n"
    "    - {formation: Wolfcamp}\n"
    "    - {formation: Ellenburger, plug_required: false}\n";

policy::EffectivePolicy resolve_test_policy(bool with_district) {
  static const policy::PolicyPack pack =
      policy::policy_pack_from_documents(kBaseYaml, {{"08a__auto", kDistrictYaml}}, "gen-test");
  policy::ResolveRequest req;
  if (with_district) req.district = "08A";
  return policy::resolve(pack, policy::CentroidTable{}, req);
}

WellFacts facts_from(const char* yaml) {
  return WellFacts::from_value(parse_yaml_text(yaml, "facts"));
}

const Step* find_type(const GenerationResult& r, StepType t) {
  auto it = std::find_if(r.steps.begin(), r.steps.end(), [t](const Step& s) { return s.type == t; });
  return it == r.steps.end() ? nullptr : &*it;
}

size_t count_type(const GenerationResult& r, StepType t) {
  return static_cast<size_t>(std::count_if(r.steps.begin(), r.steps.end(), [t](const Step& s) { return s.type == t; }));
}

bool has_violation(const GenerationResult& r, const std::string& id) {
  return r.violations.contains(id);
}

bool has_note_prefix(const GenerationResult& r, const std::string& prefix) {
  return std::any_of(r.notes.begin(), r.notes.end(), [&](const std::string& n) { return n.rfind(prefix, 0) == 0; });
}

std::string detail_text(const Step& s, const char* key) {
  const Value* v = s.details.find(key);
  return v ? v->text_or_empty() : std::string();
}

void test_pipeline_order() {
  const auto& p = default_rule_pipeline();
  expect_eq_int(static_cast<long long>(p.size()), 10, "ten rules in the pipeline");
  expect_eq_str(p.front().name, "baseline_scaffold", "scaffold runs first");
  expect_eq_str(p.back().name, "cement_class", "cement class runs last");
}

void test_new_cibp_with_cap() {
  const WellFacts f = facts_from(
      "surface_shoe_ft: 1200\n"
      "production_shoe_ft: 6815\n"
      "perf_interval: [6748, 6865]\n"
      "casing_id_in: 4.778\n"
      "stinger_od_in: 2.375\n");
  const GenerationResult r = generate_steps(f, resolve_test_policy(false), EngineSettings{});

  const Step* plug = find_type(r, StepType::kBridgePlug);
  expect_true(plug != nullptr, "bridge plug placed");
  if (plug) {
    expect_near(plug->top_ft, 6738.0, 1e-9, "CIBP 10 ft above the producing top");
    expect_true(!plug->bottom_ft.has_value(), "bridge plug is a point device");
    expect_eq_str(detail_text(*plug, "placement_basis"), "perforation", "placement basis");
    expect_near(plug->details.find("recommended_cibp_od_in")->number_or_none(), 4.528, 1e-9, "recommended OD");
    expect_true(plug->cement_class.empty(), "no cement class on a mechanical device");
  }

  const Step* cap = find_type(r, StepType::kBridgePlugCap);
  expect_true(cap != nullptr, "bridge plug cap placed");
  if (cap) {
    expect_near(cap->lo_ft(), 6738.0, 1e-9, "cap bottom at the CIBP");
    expect_near(cap->hi_ft(), 6758.0, 1e-9, "cap length from cement_above_cibp_min_ft");
    expect_eq_str(cap->cement_class, "H", "deep cap gets the deep class");
    expect_true(cap->tag_required, "cap is tagged");
    expect_true(std::find(cap->regulatory_basis.begin(), cap->regulatory_basis.end(), "16 TAC 3.14(g)(2)") !=
                    cap->regulatory_basis.end(),
                "cap cites the CIBP cap requirement");
    const Value* ver = cap->details.find("verification");
    expect_true(ver != nullptr && ver->find("action")->text_or_empty() == "TAG", "verification action TAG");
  }

  expect_eq_int(static_cast<long long>(count_type(r, StepType::kProductiveHorizonIsolationPlug)), 0,
                "horizon plug spanning the CIBP removed");
  expect_true(has_note_prefix(r, "Productive horizon isolated by new CIBP at 6738 ft"), "isolation note");

  const Step* top = find_type(r, StepType::kTopPlug);
  expect_true(top != nullptr && top->cement_class == "C", "shallow top plug gets the shallow class");
  expect_true(find_type(r, StepType::kCutCasingBelowSurface) != nullptr, "casing cut placed");
}

void test_kop_shallowest_wins() {
  const WellFacts f = facts_from(
      "surface_shoe_ft: 1200\n"
      "production_shoe_ft: 6815\n"
      "perf_interval: [6748, 6865]\n"
      "kop: {kop_md_ft: 6600, kop_tvd_ft: 6590}\n");
  const GenerationResult r = generate_steps(f, resolve_test_policy(false), EngineSettings{});

  const Step* plug = find_type(r, StepType::kBridgePlug);
  expect_true(plug != nullptr, "bridge plug placed with KOP");
  if (plug) {
    expect_near(plug->top_ft, 6550.0, 1e-9, "KOP candidate (6600 - 50) is shallower");
    expect_eq_str(detail_text(*plug, "placement_basis"), "kop", "placement basis kop");
    const Value* c = plug->details.find("candidate_depths");
    expect_near(c ? c->find("perforation_ft")->number_or_none() : std::nullopt, 6738.0, 1e-9,
                "perforation candidate recorded");
  }

  const WellFacts deep_kop = facts_from(
      "production_shoe_ft: 6815\n"
      "perf_interval: [6748, 6865]\n"
      "kop_md_ft: 9000\n");
  const GenerationResult r2 = generate_steps(deep_kop, resolve_test_policy(false), EngineSettings{});
  const Step* plug2 = find_type(r2, StepType::kBridgePlug);
  expect_near(plug2 ? std::optional<double>(plug2->top_ft) : std::nullopt, 6738.0, 1e-9,
              "deep KOP does not move the CIBP down");

  const WellFacts cased = facts_from(
      "production_shoe_ft: 9000\n"
      "perf_interval: [6748, 6865]\n");
  const GenerationResult r3 = generate_steps(cased, resolve_test_policy(false), EngineSettings{});
  expect_true(find_type(r3, StepType::kBridgePlug) == nullptr, "interval inside casing: no CIBP");
  expect_true(find_type(r3, StepType::kProductiveHorizonIsolationPlug) != nullptr, "interval inside casing: horizon plug");
}

void test_existing_cibp() {
  const WellFacts f = facts_from(
      "surface_shoe_ft: 1200\n"
      "production_shoe_ft: 6815\n"
      "perf_interval: [6748, 6865]\n"
      "existing_mechanical_barriers: [cibp]\n"
      "existing_cibp_ft: 6738\n"
      "annular_gaps:\n"
      "  - {top_ft: 7000, bottom_ft: 7100, requires_isolation: true, cement_present: false}\n");
  const GenerationResult r = generate_steps(f, resolve_test_policy(false), EngineSettings{});

  expect_true(find_type(r, StepType::kBridgePlug) == nullptr, "no new CIBP over an existing one");
  const Step* cap = find_type(r, StepType::kCibpCap);
  expect_true(cap != nullptr, "existing CIBP capped");
  if (cap) {
    expect_near(cap->lo_ft(), 6738.0, 1e-9, "cap sits on the existing CIBP");
    expect_near(cap->hi_ft(), 6758.0, 1e-9, "cap length 20 ft");
  }
  expect_eq_int(static_cast<long long>(count_type(r, StepType::kPerforateAndSqueezePlug)), 0,
                "no squeeze below the CIBP");
  expect_true(has_violation(r, "BELOW_CIBP"), "BELOW_CIBP reported");
  expect_true(std::find(r.notes.begin(), r.notes.end(),
                        "Existing CIBP at 6738 ft - tag and cap only; do not drill out.") != r.notes.end(),
              "tag-and-cap note");

  const WellFacts no_depth = facts_from("surface_shoe_ft: 1200\nexisting_mechanical_barriers: \"CIBP, packer\"\n");
  const GenerationResult r2 = generate_steps(no_depth, resolve_test_policy(false), EngineSettings{});
  expect_true(has_violation(r2, "EXISTING_CIBP_DEPTH_UNKNOWN"), "CIBP without depth reported");
  expect_true(find_type(r2, StepType::kCibpCap) == nullptr, "no cap without a depth");
}

void test_squeeze_formations_and_tagging() {
  const WellFacts f = facts_from(
      "surface_shoe_ft: 1200\n"
      "production_shoe_ft: 6815\n"
      "perf_interval: [6748, 6865]\n"
      "formation_tops_map: {San Andres: 2950}\n"
      "annular_gaps:\n"
      "  - {top_ft: 2800, bottom_ft: 3100, requires_isolation: true, cement_present: false,\n"
      "     description: annulus above TOC}\n"
      "  - {top_ft: 4000, bottom_ft: 4100, requires_isolation: true, cement_present: true}\n");
  const GenerationResult r = generate_steps(f, resolve_test_policy(true), EngineSettings{});

  expect_eq_int(static_cast<long long>(count_type(r, StepType::kPerforateAndSqueezePlug)), 1,
                "one squeeze (cemented gap skipped)");
  const Step* sq = find_type(r, StepType::kPerforateAndSqueezePlug);
  if (sq) {
    expect_near(sq->lo_ft(), 2900.0, 1e-9, "squeeze centered in the gap, capped at 100 ft");
    expect_near(sq->hi_ft(), 3050.0, 1e-9, "squeeze step includes the 50 ft cap");
    expect_eq_str(detail_text(*sq, "squeeze_context"), "cased_hole", "squeeze above the shoe is cased");
    expect_true(sq->tag_required, "squeeze tagged by default step types");
  }

  // San Andres plug [2900, 3000] lies inside the squeeze and is suppressed.
  bool san_andres = false;
  const Step* clearfork = nullptr;
  for (const Step& s : r.steps) {
    if (s.formation == "San Andres") san_andres = true;
    if (s.formation == "Clearfork") clearfork = &s;
  }
  expect_true(!san_andres, "formation plug inside the squeeze suppressed");
  expect_true(clearfork != nullptr, "district anchor plug placed");
  if (clearfork) {
    expect_near(clearfork->lo_ft(), 6150.0, 1e-9, "formation plug centered on the anchor");
    expect_eq_str(detail_text(*clearfork, "top_source"), "district_anchor", "top source recorded");
    expect_true(clearfork->tag_required, "formation tag_required honored");
    expect_true(std::find(clearfork->regulatory_basis.begin(), clearfork->regulatory_basis.end(),
                          "tx.w3a:08a:formation_top:Clearfork") != clearfork->regulatory_basis.end(),
                "formation basis string");
  }
  expect_true(has_violation(r, "FORMATION_TOP_UNKNOWN"), "Wolfcamp without a top reported");
  for (const Step& s : r.steps) {
    expect_true(s.formation != "Ellenburger", "plug_required=false skipped: " + s.formation);
  }

  const Step* shoe = find_type(r, StepType::kSurfaceCasingShoePlug);
  expect_true(shoe != nullptr && shoe->tag_required, "surface shoe tagged by district override");
}

void test_missing_facts() {
  const WellFacts f = facts_from(
      "has_uqw: true\n"
      "perf_interval: [6748, 6865]\n");
  GenerationResult r;
  bool threw = false;
  try {
    r = generate_steps(f, resolve_test_policy(false), EngineSettings{});
  } catch (const Error& e) {
    threw = true;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(!threw, "missing facts never throw");
  expect_true(has_violation(r, "SURFACE_SHOE_DEPTH_UNKNOWN"), "surface shoe missing");
  expect_true(has_violation(r, "UQW_BASE_UNKNOWN"), "uqw base missing");
  expect_true(has_violation(r, "PRODUCTION_SHOE_DEPTH_UNKNOWN"), "production shoe missing");
  expect_true(r.violations.has_blocking(), "surface shoe missing is blocking");
  expect_true(find_type(r, StepType::kTopPlug) != nullptr, "top plug still placed");
}

void test_shoe_uqw_and_devices() {
  const WellFacts f = facts_from(
      "surface_shoe_ft: 1200\n"
      "has_uqw: true\n"
      "uqw_base_ft: 300\n"
      "packer_ft: 5000\n"
      "dv_tool_ft: 1210\n");
  const GenerationResult r = generate_steps(f, resolve_test_policy(false), EngineSettings{});

  const Step* shoe = find_type(r, StepType::kSurfaceCasingShoePlug);
  if (shoe) {
    expect_near(shoe->lo_ft(), 1150.0, 1e-9, "shoe plug 50 ft below the shoe");
    expect_near(shoe->hi_ft(), 1250.0, 1e-9, "shoe plug 50 ft above the shoe");
  } else {
    fail("surface shoe plug missing");
  }

  const Step* uqw = find_type(r, StepType::kUqwIsolationPlug);
  if (uqw) {
    expect_near(uqw->lo_ft(), 250.0, 1e-9, "uqw plug below base");
    expect_near(uqw->hi_ft(), 350.0, 1e-9, "uqw plug above base");
  } else {
    fail("uqw plug missing");
  }

  expect_eq_int(static_cast<long long>(count_type(r, StepType::kMechanicalIsolationPlug)), 1,
                "packer isolated; DV tool inside the shoe plug is not");
  const Step* dev = find_type(r, StepType::kMechanicalIsolationPlug);
  expect_true(dev != nullptr && detail_text(*dev, "device") == "packer", "device isolation for the packer");
  expect_true(has_note_prefix(r, "DV tool isolation considered at 1210 ft."), "DV tool note");
}

void test_violation_log() {
  ViolationLog vlog;
  vlog.add("BELOW_CIBP", "first", "ctx");
  vlog.add("BELOW_CIBP", "second", "ctx");
  vlog.add("BELOW_CIBP", "third", "other");
  expect_eq_int(static_cast<long long>(vlog.size()), 2, "violations deduplicated by id and context");
  expect_true(!vlog.has_blocking(), "info entries are not blocking");
  expect_throws<Error>([&] { vlog.add("NOT_A_RULE", "x"); }, "unknown rule id rejected");
  expect_true(severity_for_rule("INSUFFICIENT_SHOE_COVERAGE") == Severity::kError, "shoe coverage is an error");
}

}  // namespace
}  // namespace plugplan::plan

int main() {
  using namespace plugplan;
  set_log_level(LogLevel::ERROR);

  try {
    plan::test_pipeline_order();
    plan::test_new_cibp_with_cap();
    plan::test_kop_shallowest_wins();
    plan::test_existing_cibp();
    plan::test_squeeze_formations_and_tagging();
    plan::test_missing_facts();
    plan::test_shoe_uqw_and_devices();
    plan::test_violation_log();
  } catch (const Error& e) {
    selftest::fail(std::string("unexpected error: ") + e.what());
  }

  return selftest::exit_code("step_generator_selftest");
}

/*
  Fragment 3.6 — Policy Resolution Selftest

  Covers:
    1) District / county / field name normalization.
    2) Layer precedence: base < district stub < district overlay < county < field.
    3) Completeness reporting (missing keys, unrecognized district).
    4) Field resolution strategies against the sample tx.w3a pack
       (exact in county, nearest county, nearest county occurrence).
    5) Pack lint.

  Expected use
  ------------
      ./policy_selftest
  Reads the sample pack from PLUGPLAN_TEST_PACK_DIR.
*/

#include <algorithm>
#include <map>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/yaml_value.hpp"
#include "engine/policy/geo.hpp"
#include "engine/policy/names.hpp"
#include "engine/policy/policy_knobs.hpp"
#include "engine/policy/policy_pack.hpp"
#include "engine/policy/policy_resolver.hpp"

#ifndef PLUGPLAN_TEST_PACK_DIR
#define PLUGPLAN_TEST_PACK_DIR "policy_packs/tx/w3a"
#endif

namespace plugplan::policy {
namespace {

using namespace selftest;

const char* kBaseYaml =
    "policy_id: tx.w3a\n"
    "version: test-1\n"
    "jurisdiction: TX\n"
    "form: W-3A\n"
    "base:\n"
    "  citations:\n"
    "    tac_e2: {cite: \"16 TAC 3.14(e)(2)\"}\n"
    "  requirements:\n"
    "    casing_shoe_coverage_ft: {value: 100, citation_keys: [tac_e2]}\n"
    "    duqw_coverage_ft: 100\n"
    "    tag_wait_hours: 4\n"
    "  cement_class: {cutoff_ft: 4000, shallow_class: C, deep_class: H}\n"
    "district_overlays:\n"
    "  \"8A\":\n"
    "    requirements: {tag_wait_hours: 6}\n";

std::map<std::string, std::string> layered_overlays() {
  return {
      {"8a__auto",
       "requirements: {tag_wait_hours: 8}\n"
       "counties:\n"
       "  Martin County:\n"
       "    requirements: {tag_wait_hours: 10}\n"},
      {"08A__Andrews",
       "requirements: {tag_wait_hours: 12}\n"
       "fields:\n"
       "  Spraberry (Trend Area):\n"
       "    requirements: {tag_wait_hours: 24}\n"},
  };
}

double tag_wait(const EffectivePolicy& p) {
  return materialize_knobs(p).number_or("tag_wait_hours", -1.0);
}

bool has_reason(const EffectivePolicy& p, const std::string& prefix) {
  return std::any_of(p.incomplete_reasons.begin(), p.incomplete_reasons.end(),
                     [&](const std::string& r) { return r.rfind(prefix, 0) == 0; });
}

void test_names() {
  for (const char* raw : {"8", "08", "8A", "08a", "District 08A", " 8.0 "}) {
    expect_eq_str(normalize_district(raw).value_or("<none>"), "08a", std::string("district ") + raw + " -> 08a");
  }
  expect_eq_str(normalize_district("7C").value_or("<none>"), "07c", "district 7C -> 07c");
  expect_true(!normalize_district("north").has_value(), "district without digits rejected");

  expect_eq_str(normalize_county_key("  Andrews   County "), "andrews", "county key drops suffix");
  expect_eq_str(county_file_slug("Glasscock County"), "glasscock", "county slug");
  expect_eq_str(county_file_slug("Palo Pinto"), "palo_pinto", "county slug with space");

  expect_true(field_names_equal("Spraberry (Trend Area)", "SPRABERRY"), "field names: parenthetical ignored");
  expect_true(field_names_match("Spraberry Trend", "spraberry"), "field names: fuzzy substring");
  expect_true(!field_names_equal("Wolfcamp", "Wolfberry"), "field names: distinct fields differ");
}

void test_layer_precedence() {
  const PolicyPack pack = policy_pack_from_documents(kBaseYaml, layered_overlays(), "inline");
  const CentroidTable none;

  const EffectivePolicy base_only = resolve(pack, none, {});
  expect_true(base_only.complete, "base-only resolution is complete");
  expect_near(tag_wait(base_only), 4.0, 0.0, "base value");

  const EffectivePolicy district = resolve(pack, none, {std::string("08A"), std::nullopt, std::nullopt});
  expect_eq_str(district.district.value_or(""), "08a", "district normalized");
  expect_near(tag_wait(district), 8.0, 0.0, "district overlay beats district stub");

  const EffectivePolicy martin = resolve(pack, none, {std::string("8"), std::string("Martin"), std::nullopt});
  expect_near(tag_wait(martin), 10.0, 0.0, "counties{} entry in the district overlay");

  const EffectivePolicy field =
      resolve(pack, none, {std::string("8A"), std::string("Andrews"), std::string("Spraberry (Trend Area)")});
  expect_near(tag_wait(field), 24.0, 0.0, "field layer wins");
  expect_true(field.field_resolution.method == FieldResolutionMethod::kExactInCounty, "field resolved in county");

  const std::vector<std::string> expected = {"base", "district_stub:08a", "district:08a__auto",
                                             "county:08a__andrews", "field:Spraberry (Trend Area)@andrews"};
  expect_true(field.layers_applied == expected, "layers applied in precedence order");

  const auto cites = materialize_knobs(field).citations_for("casing_shoe_coverage_ft");
  expect_true(cites.size() == 1 && cites[0] == "16 TAC 3.14(e)(2)", "citation key resolved through citations{}");
}

void test_completeness() {
  const char* thin =
      "policy_id: tx.w3a\n"
      "version: thin\n"
      "base:\n"
      "  citations: {}\n"
      "  requirements: {casing_shoe_coverage_ft: 100, tag_wait_hours: \"\"}\n";
  const PolicyPack pack = policy_pack_from_documents(thin, {}, "thin");
  const EffectivePolicy p = resolve(pack, CentroidTable{}, {std::string("08A"), std::nullopt, std::nullopt});

  expect_true(!p.complete, "thin pack is incomplete");
  expect_true(has_reason(p, "base.requirements.duqw_coverage_ft"), "missing knob reported");
  expect_true(has_reason(p, "base.requirements.tag_wait_hours"), "empty string counts as missing");
  expect_true(has_reason(p, "base.cement_class"), "missing section reported");
  expect_true(has_reason(p, "effective.cement_class.cutoff_ft [district:08a]"), "effective scope tagged with district");

  const PolicyPack full = policy_pack_from_documents(kBaseYaml, {}, "inline");
  const EffectivePolicy bad = resolve(full, CentroidTable{}, {std::string("Region Nine"), std::nullopt, std::nullopt});
  expect_true(!bad.complete, "unrecognized district makes the policy incomplete");
  expect_true(has_reason(bad, "district:Region Nine unrecognized"), "unrecognized district reason");
  expect_true(!bad.district.has_value(), "no district recorded");

  expect_throws<Error>([] { (void)policy_pack_from_documents("version: 1\nbase: {}\n", {}, "no-id"); },
                       "pack without policy_id rejected");
}

void test_centroids() {
  const CentroidTable t = CentroidTable::load_json_file(std::string(PLUGPLAN_TEST_PACK_DIR) + "/county_centroids.json");
  expect_true(t.find("Andrews County").has_value(), "centroid lookup with County suffix");
  expect_near(t.distance_km("Andrews", "Gaines"), 48.5, 1.0, "Andrews-Gaines great-circle distance");
  expect_true(!t.distance_km("Andrews", "Nowhere").has_value(), "unknown county has no distance");

  const Value bad = parse_yaml_text("[{county: X, latitude: 95, longitude: 0}]", "bad");
  expect_throws<Error>([&] { (void)CentroidTable::from_value(bad, "bad"); }, "out-of-range latitude rejected");
}

void test_sample_pack_field_resolution() {
  const std::string dir = PLUGPLAN_TEST_PACK_DIR;
  const PolicyPack pack = load_policy_pack(dir + "/base.yaml");
  const CentroidTable centroids = CentroidTable::load_json_file(dir + "/county_centroids.json");

  expect_eq_str(pack.policy_id, "tx.w3a", "sample pack id");
  expect_true(pack.overlays.count("07c__auto") == 1, "7c overlay indexed as 07c__auto");

  const EffectivePolicy exact =
      resolve(pack, centroids, {std::string("08A"), std::string("Andrews"), std::string("Spraberry (Trend Area)")});
  expect_true(exact.complete, "sample pack resolves complete");
  expect_true(exact.field_resolution.method == FieldResolutionMethod::kExactInCounty, "Andrews: exact in county");

  // Gaines has no Spraberry entry; Andrews is the closest county that does.
  const EffectivePolicy nearest =
      resolve(pack, centroids, {std::string("08A"), std::string("Gaines"), std::string("Spraberry (Trend Area)")});
  expect_true(nearest.field_resolution.method == FieldResolutionMethod::kNearestCounty, "Gaines: nearest county");
  expect_eq_str(nearest.field_resolution.matched_in_county.value_or(""), "andrews", "nearest county is Andrews");
  expect_near(nearest.field_resolution.nearest_distance_km, 48.5, 1.0, "nearest distance recorded");
  const PolicyKnobs nk = materialize_knobs(nearest);
  const bool has_dean = std::any_of(nk.formation_tops.begin(), nk.formation_tops.end(),
                                    [](const FormationRequirement& f) { return f.formation == "Dean"; });
  expect_true(has_dean, "borrowed field layer applied");

  const EffectivePolicy occurrence =
      resolve(pack, centroids, {std::string("08A"), std::string("Gaines"), std::string("Dean")});
  expect_true(occurrence.field_resolution.method == FieldResolutionMethod::kNearestCountyOccurrence,
              "Dean: nearest county occurrence");
  expect_true(!occurrence.field_resolution.matched_field.has_value(), "occurrence match has no field key");

  const EffectivePolicy unknown =
      resolve(pack, centroids, {std::string("08A"), std::string("Gaines"), std::string("Nonesuch")});
  expect_true(unknown.field_resolution.method == FieldResolutionMethod::kNone, "unknown field: none");
  expect_true(unknown.complete, "unresolved field does not make the policy incomplete");
}

void test_steps_override_knobs() {
  const char* doc =
      "policy_id: tx.w3a\n"
      "base:\n"
      "  preferences:\n"
      "    spacer: {min_bbl: 8, contact_minutes: 10, pump_rate_bpm: 2}\n"
      "  steps_overrides:\n"
      "    squeeze_via_perf: {top_ft: 2800, bottom_ft: 2900, sacks_override: 3000000000}\n"
      "    cement_plugs:\n"
      "      - top_ft: 1150\n"
      "        bottom_ft: 1300\n"
      "        sacks: 2147483647\n"
      "        displacement_margin_bbl: 2\n"
      "        segments:\n"
      "          - {top_ft: 1150, bottom_ft: 1210, casing_id_in: 8.097}\n"
      "          - {top_ft: 1300, bottom_ft: 1210, hole_d_in: 11.0, stinger_od_in: 2.875}\n"
      "          - {top_ft: 1400}\n";
  const PolicyPack pack = policy_pack_from_documents(doc, {}, "steps");
  const PolicyKnobs k = materialize_knobs(resolve(pack, CentroidTable{}, {}));

  expect_true(k.squeeze_via_perf.has_value(), "squeeze override read");
  if (k.squeeze_via_perf) {
    expect_true(!k.squeeze_via_perf->sacks_override.has_value(), "sack count beyond int range ignored");
  }

  expect_eq_int(static_cast<long long>(k.cement_plugs.size()), 1, "one cement plug override");
  if (k.cement_plugs.size() == 1) {
    const CementPlugOverride& c = k.cement_plugs[0];
    expect_eq_int(c.sacks.value_or(-1), 2147483647, "largest int sack count kept");
    expect_near(c.displacement_margin_bbl, 2.0, 0.0, "displacement margin read");
    expect_eq_int(static_cast<long long>(c.segments.size()), 2, "incomplete segment skipped");
    if (c.segments.size() == 2) {
      expect_near(c.segments[1].shallow_ft, 1210.0, 0.0, "segment interval normalized");
      expect_near(c.segments[1].deep_ft, 1300.0, 0.0, "segment interval normalized");
      expect_near(c.segments[1].geometry.hole_d_in, 11.0, 0.0, "segment hole diameter");
      expect_near(c.segments[0].geometry.casing_id_in, 8.097, 0.0, "segment casing id");
    }
  }

  expect_true(k.spacer.has_value(), "spacer preference read");
  if (k.spacer) {
    expect_near(k.spacer->min_bbl, 8.0, 0.0, "spacer floor");
    expect_near(k.spacer->spacer_multiple, 1.5, 0.0, "spacer multiple defaults");
    expect_near(k.spacer->contact_minutes, 10.0, 0.0, "spacer contact time");
  }
}

void test_lint() {
  const std::string dir = PLUGPLAN_TEST_PACK_DIR;
  const auto clean = lint_policy_pack(load_policy_pack(dir + "/base.yaml"));
  expect_eq_int(static_cast<long long>(clean.size()), 0, "sample pack lints clean");
  for (const auto& f : clean) std::cerr << "  " << f.where << ": " << f.message << "\n";

  const char* messy =
      "policy_id: tx.w3a\n"
      "base:\n"
      "  requirements: {casing_shoe_coverage_ft: lots}\n"
      "  bogus: {}\n";
  const PolicyPack pack = policy_pack_from_documents(
      messy,
      {{"north__auto", "requirements: {}\n"},
       {"08a__andrews", "overrides:\n  protect_intervals:\n    - {top_ft: 900, bottom_ft: 800}\n"}},
      "messy");
  const auto findings = lint_policy_pack(pack);

  auto found = [&](const std::string& where) {
    return std::any_of(findings.begin(), findings.end(), [&](const LintFinding& f) { return f.where == where; });
  };
  expect_true(found("north__auto"), "lint: unusable overlay name");
  expect_true(found("base"), "lint: unknown section");
  expect_true(found("base.requirements.casing_shoe_coverage_ft"), "lint: non-numeric knob");
  expect_true(found("08a__andrews.overrides.protect_intervals[0]"), "lint: inverted protect interval");
}

}  // namespace
}  // namespace plugplan::policy

int main() {
  using namespace plugplan;
  set_log_level(LogLevel::ERROR);

  try {
    policy::test_names();
    policy::test_layer_precedence();
    policy::test_completeness();
    policy::test_centroids();
    policy::test_sample_pack_field_resolution();
    policy::test_steps_override_knobs();
    policy::test_lint();
  } catch (const Error& e) {
    selftest::fail(std::string("unexpected error: ") + e.what());
  }

  return selftest::exit_code("policy_selftest");
}

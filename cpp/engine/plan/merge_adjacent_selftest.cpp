/*
  Fragment 7.3 — Long-Plug Merge Selftest

  Checks chain formation against the gap threshold, attribute union on the
  merged step, the recompute hook, chains broken by an intervening step, and
  the steps the merge must leave alone.

  Expected use
  ------------
      ./merge_adjacent_selftest
*/

#include <string>
#include <vector>

#include "engine/core/error.hpp"
#include "engine/core/selftest.hpp"
#include "engine/plan/merge_adjacent.hpp"

namespace plugplan::plan {
namespace {

using namespace selftest;

Step formation_plug(const char* name, double lo, double hi, const char* cite) {
  Step s = make_interval_step(StepType::kFormationTopPlug, lo, hi);
  s.formation = name;
  s.cement_class = "H";
  s.sacks = 25;
  s.regulatory_basis.push_back(cite);
  return s;
}

std::vector<Step> sample_steps() {
  std::vector<Step> v;
  v.push_back(formation_plug("Clearfork", 7100, 7200, "tx.w3a:08a:formation_top:Clearfork"));
  v.push_back(formation_plug("Dean", 8850, 8950, "tx.w3a:08a:formation_top:Dean"));

  Step spraberry = formation_plug("Spraberry", 7550, 7650, "tx.w3a:08a:formation_top:Spraberry");
  spraberry.tag_required = true;
  Value ver = Value::map();
  ver.set("action", Value::string("TAG"));
  ver.set("required_wait_hr", Value::number(4));
  spraberry.details.set("verification", ver);
  v.push_back(spraberry);

  v.push_back(make_interval_step(StepType::kCementPlug, 6000, 6050));

  Step pinned = formation_plug("Wolfcamp", 7000, 7050, "manual");
  pinned.details.set("materials_override", Value::boolean(true));
  v.push_back(pinned);
  return v;
}

void test_chain_and_union() {
  int recomputed = 0;
  MergeOptions opt;
  opt.threshold_ft = 500.0;
  opt.recompute = [&](Step& s) {
    ++recomputed;
    s.cement_class = "H";
  };

  const MergeResult r = merge_adjacent(sample_steps(), opt);
  expect_eq_int(r.merged_groups, 1, "one merged group");
  expect_eq_int(r.steps_absorbed, 2, "two steps absorbed");
  expect_eq_int(recomputed, 1, "recompute called once per merged step");
  expect_eq_int(static_cast<long long>(r.steps.size()), 4, "five steps become four");

  bool sorted = true;
  for (size_t i = 1; i < r.steps.size(); ++i) {
    if (r.steps[i - 1].depth_key() < r.steps[i].depth_key()) sorted = false;
  }
  expect_true(sorted, "result ordered deepest first");

  const Step* merged = nullptr;
  for (const Step& s : r.steps) {
    const Value* m = s.details.find("merged");
    if (m != nullptr && m->is_bool() && m->as_bool()) merged = &s;
  }
  expect_true(merged != nullptr, "merged step flagged");
  if (!merged) return;

  expect_near(merged->lo_ft(), 7100.0, 0.0, "merged bottom");
  expect_near(merged->hi_ft(), 7650.0, 0.0, "merged top");
  expect_true(merged->tag_required, "tag_required is OR-ed");
  expect_true(merged->details.find("verification") != nullptr, "verification carried over");
  expect_eq_int(static_cast<long long>(merged->regulatory_basis.size()), 2, "basis is the union");
  expect_true(merged->formation.empty(), "merged step has no single formation");
  expect_true(!merged->sacks.has_value(), "sacks cleared for recomputation");
  expect_eq_str(merged->cement_class, "H", "recompute hook applied");

  const Value* sources = merged->details.find("merged_steps");
  expect_true(sources != nullptr && sources->size() == 2, "two source entries");
  if (sources && sources->size() == 2) {
    expect_eq_str(sources->at(0).find("formation")->text_or_empty(), "Spraberry", "sources deepest first");
    expect_near(sources->at(1).find("bottom_ft")->number_or_none(), 7100.0, 0.0, "source interval kept");
  }

  bool dean_alone = false;
  bool pinned_alone = false;
  for (const Step& s : r.steps) {
    if (s.formation == "Dean") dean_alone = true;
    if (s.formation == "Wolfcamp") pinned_alone = true;
  }
  expect_true(dean_alone, "gap above threshold keeps plugs apart");
  expect_true(pinned_alone, "materials override excluded from merging");
}

void test_intervening_step_breaks_chain() {
  // Bridge plug at 7300 sits between two formation plugs that are within threshold.
  std::vector<Step> v;
  v.push_back(formation_plug("Clearfork", 7100, 7200, "c"));
  v.push_back(make_point_step(StepType::kBridgePlug, 7300));
  v.push_back(formation_plug("Spraberry", 7400, 7500, "s"));

  MergeOptions opt;
  opt.threshold_ft = 500.0;
  const MergeResult r = merge_adjacent(v, opt);
  expect_eq_int(r.merged_groups, 0, "bridge plug between plugs blocks the merge");
  expect_eq_int(static_cast<long long>(r.steps.size()), 3, "all three steps kept");
  if (r.steps.size() == 3) {
    expect_true(r.steps[1].type == StepType::kBridgePlug, "bridge plug stays between the plugs");
  }

  // A pinned plug of the same type in between also closes the chain.
  std::vector<Step> pinned_between;
  pinned_between.push_back(formation_plug("Clearfork", 7100, 7200, "c"));
  Step pinned = formation_plug("Dean", 7250, 7300, "manual");
  pinned.details.set("materials_override", Value::boolean(true));
  pinned_between.push_back(pinned);
  pinned_between.push_back(formation_plug("Spraberry", 7400, 7500, "s"));
  const MergeResult r2 = merge_adjacent(pinned_between, opt);
  expect_eq_int(r2.merged_groups, 0, "override plug between plugs blocks the merge");

  // Without the device the same pair merges.
  std::vector<Step> pair;
  pair.push_back(formation_plug("Clearfork", 7100, 7200, "c"));
  pair.push_back(formation_plug("Spraberry", 7400, 7500, "s"));
  expect_eq_int(merge_adjacent(pair, opt).merged_groups, 1, "pair merges when nothing intervenes");
}

void test_threshold_edges() {
  std::vector<Step> touching;
  touching.push_back(formation_plug("A", 200, 300, "a"));
  touching.push_back(formation_plug("B", 100, 200, "b"));

  MergeOptions zero;
  zero.threshold_ft = 0.0;
  const MergeResult r = merge_adjacent(touching, zero);
  expect_eq_int(r.merged_groups, 1, "touching plugs merge at threshold 0");

  MergeOptions other_type;
  other_type.types = {"cement_plug"};
  const MergeResult r2 = merge_adjacent(touching, other_type);
  expect_eq_int(r2.merged_groups, 0, "types outside the list are untouched");

  MergeOptions bad;
  bad.threshold_ft = -1.0;
  expect_throws<Error>([&] { (void)merge_adjacent(touching, bad); }, "negative threshold rejected");

  const MergeResult empty = merge_adjacent({}, MergeOptions{});
  expect_true(empty.steps.empty() && empty.merged_groups == 0, "empty input");
}

}  // namespace
}  // namespace plugplan::plan

int main() {
  plugplan::plan::test_chain_and_union();
  plugplan::plan::test_intervening_step_breaks_chain();
  plugplan::plan::test_threshold_edges();
  return plugplan::selftest::exit_code("merge_adjacent_selftest");
}

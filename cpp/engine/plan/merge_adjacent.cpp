#include "engine/plan/merge_adjacent.hpp"

#include <algorithm>
#include <utility>

#include "engine/core/error.hpp"

namespace plugplan::plan {

namespace {

Value merged_entry(const Step& s) {
  Value v = Value::map();
  v.set("formation", s.formation.empty() ? Value::null() : Value::string(s.formation));
  v.set("top_ft", Value::number(s.hi_ft()));
  v.set("bottom_ft", Value::number(s.lo_ft()));
  return v;
}

// Source entries of a step that may itself be a merge product.
void append_sources(const Step& s, Value& list) {
  const Value* prior = s.details.find("merged_steps");
  if (prior != nullptr && prior->is_list()) {
    for (size_t i = 0; i < prior->size(); ++i) list.push_back(prior->at(i));
    return;
  }
  list.push_back(merged_entry(s));
}

Step merge_group(const std::vector<Step>& group) {
  Step out = group.front();
  double lo = out.lo_ft();
  double hi = out.hi_ft();
  Value sources = Value::list();
  const Value* verification = nullptr;

  for (const Step& s : group) {
    lo = std::min(lo, s.lo_ft());
    hi = std::max(hi, s.hi_ft());
    out.add_basis(s.regulatory_basis);
    out.tag_required = out.tag_required || s.tag_required;
    if (verification == nullptr) verification = s.details.find("verification");
    append_sources(s, sources);
  }

  out.top_ft = hi;
  out.bottom_ft = lo;
  out.formation.clear();
  out.cement_class.clear();
  out.sacks.reset();
  out.materials.reset();
  out.details = Value::map();
  out.details.set("merged", Value::boolean(true));
  out.details.set("merged_steps", std::move(sources));
  if (verification != nullptr) out.details.set("verification", *verification);
  return out;
}

} // namespace

MergeResult merge_adjacent(std::vector<Step> steps, const MergeOptions& opt) {
  PLUGPLAN_ENSURE(opt.threshold_ft >= 0.0, ErrorCode::kInvalidArgument, "merge threshold_ft must be >= 0");

  std::stable_sort(steps.begin(), steps.end(),
                   [](const Step& a, const Step& b) { return a.depth_key() > b.depth_key(); });

  MergeResult res;
  std::vector<Step> chain;  // one open chain; any other step in depth order closes it
  double chain_lo = 0.0;

  auto mergeable = [&](const Step& s) {
    return !s.materials_override() &&
           std::find(opt.types.begin(), opt.types.end(), to_string(s.type)) != opt.types.end();
  };

  auto flush = [&]() {
    if (chain.empty()) return;
    if (chain.size() == 1) {
      res.steps.push_back(std::move(chain.front()));
    } else {
      Step merged = merge_group(chain);
      if (opt.recompute) opt.recompute(merged);
      res.merged_groups += 1;
      res.steps_absorbed += static_cast<int>(chain.size());
      res.steps.push_back(std::move(merged));
    }
    chain.clear();
  };

  for (Step& s : steps) {
    if (!mergeable(s)) {
      flush();
      res.steps.push_back(std::move(s));
      continue;
    }
    if (!chain.empty() && (s.type != chain.front().type || chain_lo - s.hi_ft() > opt.threshold_ft)) flush();
    chain_lo = chain.empty() ? s.lo_ft() : std::min(chain_lo, s.lo_ft());
    chain.push_back(std::move(s));
  }
  flush();

  std::stable_sort(res.steps.begin(), res.steps.end(),
                   [](const Step& a, const Step& b) { return a.depth_key() > b.depth_key(); });
  return res;
}

} // namespace plugplan::plan

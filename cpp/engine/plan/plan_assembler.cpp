#include "engine/plan/plan_assembler.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"

namespace plugplan::plan {

namespace {

const char* kFormationTopMarker = ":formation_top:";

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += sep;
    out += v[i];
  }
  return out;
}

std::optional<double> detail_number(const Value& details, std::string_view path) {
  const Value* v = details.find_path(path);
  return v ? v->number_or_none() : std::nullopt;
}

std::optional<double> wait_hours_of(const Step& s) {
  if (!s.tag_required) return std::nullopt;
  return detail_number(s.details, "verification.required_wait_hr");
}

double round2(double v) {
  return std::round(v * 100.0) / 100.0;
}

void collect_formations(const Step& s, std::set<std::string>& out) {
  if (!s.formation.empty()) out.insert(s.formation);
  const Value* merged = s.details.find("merged_steps");
  if (merged != nullptr && merged->is_list()) {
    for (size_t i = 0; i < merged->size(); ++i) {
      const Value* f = merged->at(i).find("formation");
      if (f != nullptr && f->is_string() && !f->as_string().empty()) out.insert(f->as_string());
    }
  }
  for (const std::string& cite : s.regulatory_basis) {
    const size_t at = cite.find(kFormationTopMarker);
    if (at == std::string::npos) continue;
    const std::string name = cite.substr(at + std::char_traits<char>::length(kFormationTopMarker));
    if (!name.empty()) out.insert(name);
  }
}

} // namespace

std::string mechanical_type_label(StepType t) {
  switch (t) {
    case StepType::kBridgePlug: return "CIBP";
    case StepType::kBridgePlugCap:
    case StepType::kCibpCap: return "CIBP cap";
    case StepType::kCementRetainer: return "Cement retainer";
    case StepType::kPerforateAndSqueezePlug: return "Perforate and squeeze";
    case StepType::kPerfCirculate: return "Perforate and circulate";
    case StepType::kCutCasingBelowSurface: return "Cut casing";
    default: return "Cement plug";
  }
}

std::string regulatory_purpose(const Step& s) {
  switch (s.type) {
    case StepType::kSurfaceCasingShoePlug: return "Surface casing shoe";
    case StepType::kIntermediateCasingShoePlug: return "Intermediate casing shoe";
    case StepType::kUqwIsolationPlug: return "Usable-quality water isolation";
    case StepType::kProductiveHorizonIsolationPlug: return "Productive horizon isolation";
    case StepType::kTopPlug: return "Surface plug";
    case StepType::kCutCasingBelowSurface: return "Cut and cap casing below surface";
    case StepType::kBridgePlug: return "Isolate producing interval";
    case StepType::kBridgePlugCap:
    case StepType::kCibpCap: return "Cement cap above CIBP";
    case StepType::kCementRetainer: return "Cement retainer";
    case StepType::kPerforateAndSqueezePlug: return "Annular isolation behind pipe";
    case StepType::kPerfCirculate: return "Perforate and circulate";
    case StepType::kMechanicalIsolationPlug: {
      const Value* d = s.details.find("device");
      return (d != nullptr && d->text_or_empty() == "dv_tool") ? "DV tool isolation" : "Packer isolation";
    }
    case StepType::kFormationTopPlug:
      return s.formation.empty() ? "Formation top isolation" : "Formation top isolation: " + s.formation;
    case StepType::kCementPlug: {
      const Value* r = s.details.find("reason");
      return (r != nullptr && !r->text_or_empty().empty()) ? "Cement plug: " + r->text_or_empty() : "Cement plug";
    }
  }
  return "Cement plug";
}

std::vector<std::string> additional_operations(const Step& s) {
  std::vector<std::string> ops;
  if (s.type == StepType::kPerforateAndSqueezePlug || s.type == StepType::kPerfCirculate) {
    const char* key = s.type == StepType::kPerfCirculate ? "perforation_interval" : "squeeze_interval";
    const auto lo = detail_number(s.details, std::string(key) + ".bottom_ft");
    const auto hi = detail_number(s.details, std::string(key) + ".top_ft");
    if (lo && hi) ops.push_back("Perforate at " + format_number(*lo) + "-" + format_number(*hi) + " ft");
  }
  if (s.type == StepType::kPerforateAndSqueezePlug) {
    ops.push_back("Squeeze cement through perforations into annulus");
    const auto cap_len = detail_number(s.details, "cap_length_ft");
    const auto lo = detail_number(s.details, "cap_interval.bottom_ft");
    const auto hi = detail_number(s.details, "cap_interval.top_ft");
    if (cap_len && lo && hi) {
      ops.push_back("Pump " + format_number(*cap_len) + " ft cement cap inside casing from " + format_number(*lo) +
                    "-" + format_number(*hi) + " ft");
    }
  }
  if (const auto wait = wait_hours_of(s)) {
    ops.push_back("Wait " + format_number(*wait) + " hr and tag TOC");
  }
  return ops;
}

std::vector<RrcExportRow> build_rrc_export(const std::vector<Step>& steps) {
  std::vector<RrcExportRow> rows;
  rows.reserve(steps.size());
  int plug_no = 0;
  for (const Step& s : steps) {
    RrcExportRow r;
    if (s.type != StepType::kCutCasingBelowSurface) r.plug_no = ++plug_no;
    r.step_id = s.step_id;
    r.type = to_string(s.type);
    r.mechanical_type = mechanical_type_label(s.type);
    r.regulatory_purpose = regulatory_purpose(s);
    r.from_ft = s.lo_ft();
    r.to_ft = s.hi_ft();
    r.sacks = s.sacks;
    r.cement_class = s.cement_class;
    r.wait_hours = wait_hours_of(s);
    r.tag_required = s.tag_required;
    if (is_cement_bearing(s.type)) r.toc_ft = s.hi_ft();
    r.additional_operations = additional_operations(s);
    r.remarks = join(s.regulatory_basis, "; ");
    rows.push_back(std::move(r));
  }
  return rows;
}

std::string plan_fingerprint(const Plan& p) {
  Fnv1a64 h;
  h.update_string(p.kernel_version);
  h.update_string(p.policy_id);
  h.update_string(p.policy_version);
  h.update_string(p.district.value_or(""));
  h.update_bool(p.policy_complete);
  h.update_u64(p.steps.size());
  for (const Step& s : p.steps) {
    h.update_i64(s.step_id);
    h.update_string(to_string(s.type));
    h.update_f64(s.lo_ft());
    h.update_f64(s.hi_ft());
    h.update_string(s.cement_class);
    h.update_i64(s.sacks.value_or(-1));
    h.update_bool(s.tag_required);
    h.update_string(s.formation);
    h.update_u64(s.regulatory_basis.size());
    for (const std::string& c : s.regulatory_basis) h.update_string(c);
  }
  h.update_u64(p.violations.size());
  for (const Violation& v : p.violations) {
    h.update_string(v.rule_id);
    h.update_string(v.context);
  }
  h.update_i64(p.materials_totals.total_sacks.value_or(-1));
  return hash_to_hex(h.digest());
}

Plan assemble_plan(AssemblyInput in) {
  const policy::EffectivePolicy& pol = in.policy;
  Plan p;
  p.kernel_version = in.kernel_version;
  p.policy_id = pol.policy_id;
  p.policy_version = pol.version;
  p.jurisdiction = pol.jurisdiction;
  p.form = pol.form;
  p.district = pol.district;
  p.county = pol.county;
  p.field = pol.field;
  p.field_resolution = pol.field_resolution;
  p.policy_complete = pol.complete;
  p.incomplete_reasons = pol.incomplete_reasons;
  p.api14 = in.well.api14;
  p.long_plug_merge_applied = in.merge_applied;

  // ---- Order + ids ----
  std::stable_sort(in.steps.begin(), in.steps.end(),
                   [](const Step& a, const Step& b) { return a.depth_key() > b.depth_key(); });
  for (size_t i = 0; i < in.steps.size(); ++i) in.steps[i].step_id = static_cast<int>(i) + 1;

  // ---- Violations ----
  if (!pol.complete) {
    in.violations.add("POLICY_INCOMPLETE", "policy incomplete: " + join(pol.incomplete_reasons, ", "), "policy");
  }
  for (const Step& s : in.steps) {
    if (is_cement_bearing(s.type) && s.regulatory_basis.empty()) {
      in.violations.add("MISSING_CITATION", std::string(to_string(s.type)) + " has no regulatory basis",
                        "step:" + std::to_string(s.step_id) + ":" + to_string(s.type));
    }
  }

  // ---- Totals ----
  int total_sacks = 0;
  double total_bbl = 0.0;
  for (const Step& s : in.steps) {
    if (s.sacks) total_sacks += *s.sacks;
    if (s.materials && s.materials->sacks) total_bbl += s.materials->total_bbl;
  }
  if (total_sacks > 0) p.materials_totals.total_sacks = total_sacks;
  if (total_bbl > 0.0) p.materials_totals.total_bbl = round2(total_bbl);

  // ---- Formations ----
  std::set<std::string> formations;
  for (const Step& s : in.steps) collect_formations(s, formations);
  p.formations_targeted.assign(formations.begin(), formations.end());
  for (const FormationTop& t : in.well.formation_tops) p.formation_tops_detected.push_back(t.formation);

  // ---- Notes ----
  p.plan_notes = std::move(in.notes);
  if (in.merge_applied && in.merged_groups > 0) {
    p.plan_notes.push_back("Long-plug merge combined " + std::to_string(in.merged_groups) +
                           " group(s) of adjacent plugs.");
  }
  p.operational_instructions = in.knobs.operational.render();

  p.rrc_export = build_rrc_export(in.steps);
  p.steps = std::move(in.steps);
  p.violations = in.violations.items();
  p.fingerprint = plan_fingerprint(p);

  log(LogLevel::DEBUG, "plan assembled: " + std::to_string(p.steps.size()) + " steps, " +
                           std::to_string(p.violations.size()) + " violations, fingerprint " + p.fingerprint);
  return p;
}

} // namespace plugplan::plan

#include "engine/policy/policy_knobs.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include "engine/core/logging.hpp"
#include "engine/policy/names.hpp"

namespace plugplan::policy {

namespace {

const Value& empty_value() {
  static const Value kEmpty;
  return kEmpty;
}

const Value& child(const Value& v, std::string_view key) {
  const Value* c = v.find(key);
  return c ? *c : empty_value();
}

std::optional<double> num(const Value& v, std::string_view key) {
  const Value* c = v.find(key);
  return c ? c->number_or_none() : std::nullopt;
}

std::optional<int> count(const Value& v, std::string_view key) {
  const auto n = num(v, key);
  if (!n || *n < 0.0 || *n > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;
  return static_cast<int>(std::lround(*n));
}

bool flag(const Value& v, std::string_view key, bool fallback) {
  const Value* c = v.find(key);
  if (c == nullptr) return fallback;
  return c->bool_or_none().value_or(fallback);
}

std::string text(const Value& v, std::string_view key) {
  const Value* c = v.find(key);
  return c ? c->text_or_empty() : std::string();
}

std::vector<std::string> strings(const Value& v) {
  std::vector<std::string> out;
  if (v.is_list()) {
    for (size_t i = 0; i < v.size(); ++i) {
      std::string s = v.at(i).text_or_empty();
      if (!s.empty()) out.push_back(std::move(s));
    }
  } else if (v.present()) {
    out.push_back(v.text_or_empty());
  }
  return out;
}

// [a, b] under `interval_ft`, or top_ft/bottom_ft; returned as (shallow, deep).
std::optional<std::pair<double, double>> interval_of(const Value& entry) {
  std::optional<double> a;
  std::optional<double> b;
  if (const Value* iv = entry.find("interval_ft"); iv != nullptr && iv->is_list() && iv->size() == 2) {
    a = iv->at(0).number_or_none();
    b = iv->at(1).number_or_none();
  } else {
    a = num(entry, "top_ft");
    b = num(entry, "bottom_ft");
  }
  if (!a || !b) return std::nullopt;
  return std::make_pair(std::min(*a, *b), std::max(*a, *b));
}

GeometryDefault geometry_of(const Value& v) {
  GeometryDefault g;
  g.casing_id_in = num(v, "casing_id_in");
  g.stinger_od_in = num(v, "stinger_od_in");
  g.stinger_id_in = num(v, "stinger_id_in");
  g.hole_d_in = num(v, "hole_d_in");
  g.annular_excess = num(v, "annular_excess");
  return g;
}

materials::CementRecipe recipe_of(const Value& v, const std::string& fallback_id) {
  materials::CementRecipe r;
  r.id = text(v, "id");
  if (r.id.empty()) r.id = fallback_id;
  r.cement_class = text(v, "class");
  r.density_ppg = num(v, "density_ppg").value_or(0.0);
  r.yield_ft3_per_sk = num(v, "yield_ft3_per_sk").value_or(0.0);
  r.water_gal_per_sk = num(v, "water_gal_per_sk").value_or(0.0);
  const Value& adds = child(v, "additives");
  for (size_t i = 0; i < adds.size() && adds.is_list(); ++i) {
    const Value& a = adds.at(i);
    materials::Additive add;
    add.name = text(a, "name");
    add.rate_per_sack = num(a, "rate").value_or(0.0);
    add.unit = text(a, "unit");
    if (!add.name.empty()) r.additives.push_back(std::move(add));
  }
  return r;
}

void read_preferences(const Value& prefs, PolicyKnobs& k) {
  const Value& recipes = child(prefs, "recipes");
  for (size_t i = 0; recipes.is_map() && i < recipes.keys().size(); ++i) {
    materials::CementRecipe r = recipe_of(recipes.item(i), "class_" + recipes.keys()[i]);
    if (r.cement_class.empty()) r.cement_class = recipes.keys()[i];
    k.recipes[recipes.keys()[i]] = std::move(r);
  }
  if (const Value& d = child(prefs, "default_recipe"); d.is_map()) {
    k.default_recipe = recipe_of(d, "default");
  }

  const Value& geo = child(prefs, "geometry_defaults");
  for (size_t i = 0; geo.is_map() && i < geo.keys().size(); ++i) {
    k.geometry_defaults[geo.keys()[i]] = geometry_of(geo.item(i));
  }

  k.annular_excess = num(prefs, "annular_excess");

  const Value& spacer = child(prefs, "spacer");
  if (spacer.is_map()) {
    materials::SpacerSpec sp;
    sp.min_bbl = num(spacer, "min_bbl").value_or(sp.min_bbl);
    sp.spacer_multiple = num(spacer, "spacer_multiple").value_or(sp.spacer_multiple);
    sp.contact_minutes = num(spacer, "contact_minutes");
    sp.pump_rate_bpm = num(spacer, "pump_rate_bpm");
    k.spacer = sp;
  }

  const Value& merge = child(prefs, "long_plug_merge");
  if (merge.is_map()) {
    k.merge.enabled = flag(merge, "enabled", false);
    k.merge.threshold_ft = num(merge, "threshold_ft").value_or(k.merge.threshold_ft);
    auto types = strings(child(merge, "types"));
    if (!types.empty()) k.merge.types = std::move(types);
  }

  const Value& op = child(prefs, "operational");
  if (op.is_map()) {
    k.operational.pump_via_tubing = flag(op, "pump_via_tubing", false);
    k.operational.notice_hours = num(op, "notice_hours");
    k.operational.mud_min_weight_ppg = num(op, "mud_min_weight_ppg");
    k.operational.funnel_min_s = num(op, "funnel_min_s");
  }
}

void read_overrides(const Value& ov, PolicyKnobs& k) {
  const Value& tag = child(ov, "tag");
  k.tag_surface_shoe_in_oh = flag(tag, "surface_shoe_in_oh", false);
  k.tag_formations = strings(child(tag, "formations"));
  k.tagging_required_hint = flag(ov, "tagging_required_hint", false);

  const Value& tops = child(ov, "formation_tops");
  for (size_t i = 0; tops.is_list() && i < tops.size(); ++i) {
    const Value& e = tops.at(i);
    FormationRequirement f;
    f.formation = text(e, "formation");
    if (f.formation.empty()) continue;
    f.top_ft = num(e, "top_ft");
    f.plug_required = flag(e, "plug_required", true);
    f.tag_required = flag(e, "tag_required", false);
    k.formation_tops.push_back(std::move(f));
  }

  const Value& protect = child(ov, "protect_intervals");
  for (size_t i = 0; protect.is_list() && i < protect.size(); ++i) {
    const auto iv = interval_of(protect.at(i));
    if (!iv) continue;
    k.protect_intervals.push_back({iv->first, iv->second, text(protect.at(i), "reason")});
  }
}

void read_steps_overrides(const Value& so, PolicyKnobs& k) {
  k.cibp_cap_length_ft = num(child(so, "cibp_cap"), "cap_length_ft");

  const Value& sq = child(so, "squeeze_via_perf");
  if (sq.is_map()) {
    if (const auto iv = interval_of(sq)) {
      SqueezeOverride s;
      s.shallow_ft = iv->first;
      s.deep_ft = iv->second;
      s.sacks_override = count(sq, "sacks_override");
      s.citations = k.resolve_citations(child(sq, "citations"));
      k.squeeze_via_perf = std::move(s);
    }
  }

  const Value& pc = child(so, "perf_circulate");
  for (size_t i = 0; pc.is_list() && i < pc.size(); ++i) {
    const auto iv = interval_of(pc.at(i));
    if (!iv) continue;
    k.perf_circulate.push_back({iv->first, iv->second, k.resolve_citations(child(pc.at(i), "citations"))});
  }

  const Value& cp = child(so, "cement_plugs");
  for (size_t i = 0; cp.is_list() && i < cp.size(); ++i) {
    const Value& e = cp.at(i);
    const auto iv = interval_of(e);
    if (!iv) continue;
    CementPlugOverride c;
    c.shallow_ft = iv->first;
    c.deep_ft = iv->second;
    c.geometry_context = text(e, "geometry_context");
    c.geometry = geometry_of(e);
    const Value& segs = child(e, "segments");
    for (size_t j = 0; segs.is_list() && j < segs.size(); ++j) {
      const auto siv = interval_of(segs.at(j));
      if (!siv) continue;
      c.segments.push_back({siv->first, siv->second, geometry_of(segs.at(j))});
    }
    c.displacement_margin_bbl = num(e, "displacement_margin_bbl");
    c.sacks = count(e, "sacks");
    c.citations = k.resolve_citations(child(e, "citations"));
    c.note = text(e, "note");
    k.cement_plugs.push_back(std::move(c));
  }
}

} // namespace

std::string CementClassRule::pick(double midpoint_ft) const {
  if (!cutoff_ft) return deep_class.empty() ? shallow_class : deep_class;
  return midpoint_ft < *cutoff_ft ? shallow_class : deep_class;
}

std::vector<std::string> OperationalInstructions::render() const {
  std::vector<std::string> out;
  if (notice_hours) {
    out.push_back("Notify the district office at least " + format_number(*notice_hours) +
                  " hours before plugging operations begin.");
  }
  if (pump_via_tubing) out.push_back("Pump all cement plugs through tubing or drill pipe.");
  if (mud_min_weight_ppg) {
    out.push_back("Leave mud-laden fluid of at least " + format_number(*mud_min_weight_ppg) +
                  " ppg between plugs.");
  }
  if (funnel_min_s) {
    out.push_back("Mud funnel viscosity must be at least " + format_number(*funnel_min_s) + " seconds.");
  }
  return out;
}

Knob PolicyKnobs::knob(std::string_view name) const {
  Knob k;
  const Value* v = requirements.find(name);
  if (v == nullptr) return k;
  if (v->is_map()) {
    if (const Value* inner = v->find("value")) k.value = inner->number_or_none();
    k.citations = resolve_citations(child(*v, "citation_keys"));
  } else {
    k.value = v->number_or_none();
  }
  return k;
}

double PolicyKnobs::number_or(std::string_view name, double fallback) const {
  return knob(name).value.value_or(fallback);
}

std::vector<std::string> PolicyKnobs::citations_for(std::string_view name) const {
  return knob(name).citations;
}

std::vector<std::string> PolicyKnobs::resolve_citations(const Value& keys) const {
  std::vector<std::string> out;
  for (const std::string& key : strings(keys)) {
    const Value* c = citations.find(key);
    std::string cite = c ? c->text_or_empty() : std::string();
    if (c != nullptr && c->is_map()) cite = text(*c, "cite");
    out.push_back(cite.empty() ? key : cite);
  }
  return out;
}

const materials::CementRecipe* PolicyKnobs::recipe_for(std::string_view cement_class) const {
  auto it = recipes.find(std::string(cement_class));
  if (it != recipes.end()) return &it->second;
  return default_recipe ? &*default_recipe : nullptr;
}

const GeometryDefault* PolicyKnobs::geometry_default_for(std::string_view step_type) const {
  auto it = geometry_defaults.find(std::string(step_type));
  if (it != geometry_defaults.end()) return &it->second;
  it = geometry_defaults.find("default");
  return it == geometry_defaults.end() ? nullptr : &it->second;
}

bool PolicyKnobs::formation_tagged(std::string_view formation) const {
  for (const auto& f : tag_formations) {
    if (field_names_equal(f, formation)) return true;
  }
  return false;
}

PolicyKnobs materialize_knobs(const EffectivePolicy& policy) {
  PolicyKnobs k;
  k.policy_id = policy.policy_id;
  k.district = policy.district;

  const Value& eff = policy.effective;
  k.requirements = child(eff, "requirements");
  k.citations = child(eff, "citations");

  const Value& cc = child(eff, "cement_class");
  k.cement_class.cutoff_ft = num(cc, "cutoff_ft");
  k.cement_class.shallow_class = text(cc, "shallow_class");
  k.cement_class.deep_class = text(cc, "deep_class");

  read_preferences(child(eff, "preferences"), k);
  read_overrides(child(eff, "overrides"), k);
  read_steps_overrides(child(eff, "steps_overrides"), k);

  if (const Value* t = k.requirements.find("tag_required_step_types"); t != nullptr) {
    const Value& list = (t->is_map() && t->find("value") != nullptr) ? *t->find("value") : *t;
    k.tag_required_step_types = strings(list);
  }

  log(LogLevel::DEBUG, "knobs materialized for " + k.policy_id + ": " + std::to_string(k.formation_tops.size()) +
                           " formation tops, " + std::to_string(k.recipes.size()) + " recipes");
  return k;
}

} // namespace plugplan::policy

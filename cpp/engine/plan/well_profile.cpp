#include "engine/plan/well_profile.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>

#include "engine/policy/names.hpp"

namespace plugplan::plan {

namespace {

std::optional<double> first_number(const WellFacts& f, std::initializer_list<std::string_view> keys) {
  for (std::string_view k : keys) {
    if (auto v = f.number(k)) return v;
  }
  return std::nullopt;
}

std::string first_text(const WellFacts& f, std::initializer_list<std::string_view> keys) {
  for (std::string_view k : keys) {
    std::string s = f.text(k);
    if (!s.empty()) return s;
  }
  return std::string();
}

std::optional<DepthRange> range_of(const Value& v) {
  std::optional<double> a;
  std::optional<double> b;
  if (v.is_list() && v.size() == 2) {
    a = v.at(0).number_or_none();
    b = v.at(1).number_or_none();
  } else if (v.is_map()) {
    const Value* t = v.find("top_ft");
    const Value* btm = v.find("bottom_ft");
    if (t == nullptr) t = v.find("top");
    if (btm == nullptr) btm = v.find("bottom");
    if (t) a = t->number_or_none();
    if (btm) b = btm->number_or_none();
  }
  if (!a || !b) return std::nullopt;
  return DepthRange{std::min(*a, *b), std::max(*a, *b)};
}

// Either a single interval ([a, b] / {top_ft, bottom_ft}) or a list of them.
void append_ranges(const Value* v, std::vector<DepthRange>& out) {
  if (v == nullptr) return;
  const bool single_pair = v->is_list() && v->size() == 2 && v->at(0).number_or_none().has_value();
  if (v->is_map() || single_pair) {
    if (auto r = range_of(*v)) out.push_back(*r);
    return;
  }
  if (!v->is_list()) return;
  for (size_t i = 0; i < v->size(); ++i) {
    if (auto r = range_of(v->at(i))) out.push_back(*r);
  }
}

std::string barrier_token(std::string_view raw) {
  std::string t;
  for (char c : raw) {
    if (c == ' ' || c == '-') t.push_back('_');
    else t.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  while (!t.empty() && t.front() == '_') t.erase(t.begin());
  while (!t.empty() && t.back() == '_') t.pop_back();
  return t;
}

std::vector<std::string> barrier_list(const Value* v) {
  std::vector<std::string> out;
  if (v == nullptr) return out;
  auto add = [&](std::string_view s) {
    std::string t = barrier_token(s);
    if (!t.empty() && std::find(out.begin(), out.end(), t) == out.end()) out.push_back(std::move(t));
  };
  if (v->is_list()) {
    for (size_t i = 0; i < v->size(); ++i) add(v->at(i).text_or_empty());
  } else if (v->is_string()) {
    std::stringstream ss(v->as_string());
    std::string part;
    while (std::getline(ss, part, ',')) add(part);
  }
  return out;
}

} // namespace

bool WellProfile::has_barrier(std::string_view token) const {
  return std::find(mechanical_barriers.begin(), mechanical_barriers.end(), token) != mechanical_barriers.end();
}

bool WellProfile::inside_liner(const DepthRange& r) const {
  for (const DepthRange& l : liners) {
    if (l.covers(r)) return true;
  }
  return false;
}

std::optional<double> WellProfile::formation_top(std::string_view formation) const {
  for (const FormationTop& t : formation_tops) {
    if (policy::field_names_equal(t.formation, formation)) return t.top_ft;
  }
  return std::nullopt;
}

std::optional<DepthRange> WellProfile::deepest_producing_interval() const {
  if (!producing_intervals.empty()) {
    const DepthRange* best = &producing_intervals.front();
    for (const DepthRange& r : producing_intervals) {
      if (r.deep_ft > best->deep_ft) best = &r;
    }
    return *best;
  }
  if (!formation_tops.empty()) {
    const double top = formation_tops.back().top_ft;
    return DepthRange{top, top};
  }
  return std::nullopt;
}

WellProfile build_well_profile(const WellFacts& f) {
  WellProfile p;
  p.api14 = first_text(f, {"api14", "api"});
  p.district = f.text("district");
  p.county = f.text("county");
  p.field = f.text("field");

  p.surface_shoe_ft = first_number(f, {"surface_shoe_ft", "surface_casing_shoe_ft"});
  p.intermediate_shoe_ft = first_number(f, {"intermediate_shoe_ft", "intermediate_casing_shoe_ft"});
  p.production_shoe_ft = first_number(f, {"production_shoe_ft", "production_casing_shoe_ft"});

  p.has_uqw = f.flag("has_uqw").value_or(false);
  p.uqw_base_ft = first_number(f, {"uqw_base_ft", "uqw_depth_ft"});

  for (std::string_view k : {"producing_intervals", "injection_intervals", "disposal_intervals", "perforations",
                             "perf_interval", "producing_interval_ft"}) {
    append_ranges(f.value(k), p.producing_intervals);
  }

  if (const Value* tops = f.value("formation_tops_map"); tops != nullptr && tops->is_map()) {
    for (size_t i = 0; i < tops->keys().size(); ++i) {
      const auto d = tops->item(i).number_or_none();
      if (d) p.formation_tops.push_back({tops->keys()[i], *d});
    }
    std::sort(p.formation_tops.begin(), p.formation_tops.end(), [](const FormationTop& a, const FormationTop& b) {
      if (a.top_ft != b.top_ft) return a.top_ft < b.top_ft;
      return a.formation < b.formation;
    });
  }

  p.mechanical_barriers = barrier_list(f.value("existing_mechanical_barriers"));
  p.existing_cibp_ft = f.number("existing_cibp_ft");
  p.packer_ft = f.number("packer_ft");
  p.dv_tool_ft = first_number(f, {"dv_tool_ft", "dv_tool_depth_ft"});
  p.kop_md_ft = first_number(f, {"kop.kop_md_ft", "kop_md_ft"});
  p.kop_tvd_ft = first_number(f, {"kop.kop_tvd_ft", "kop_tvd_ft"});

  if (const Value* gaps = f.value("annular_gaps"); gaps != nullptr && gaps->is_list()) {
    for (size_t i = 0; i < gaps->size(); ++i) {
      const Value& g = gaps->at(i);
      const auto r = range_of(g);
      if (!r) continue;
      AnnularGap gap;
      gap.range = *r;
      if (const Value* v = g.find("requires_isolation")) gap.requires_isolation = v->bool_or_none().value_or(false);
      if (const Value* v = g.find("cement_present")) gap.cement_present = v->bool_or_none().value_or(false);
      if (const Value* v = g.find("description")) gap.description = v->text_or_empty();
      p.annular_gaps.push_back(std::move(gap));
    }
  }

  append_ranges(f.value("liner_intervals"), p.liners);

  p.casing_id_in = first_number(f, {"production_casing_id_in", "casing_id_in"});
  p.casing_od_in = first_number(f, {"production_casing_od_in", "casing_od_in"});
  p.stinger_od_in = first_number(f, {"stinger_od_in", "tubing_od_in"});
  p.stinger_id_in = first_number(f, {"stinger_id_in", "tubing_id_in"});
  p.hole_size_in = first_number(f, {"hole_size_in", "production_hole_size_in"});

  return p;
}

} // namespace plugplan::plan

/*
================================================================================
Fragment 9.1 — Exports: Plan / Policy JSON Serializer (Implementation)
FILE: cpp/engine/exports/plan_json.cpp
================================================================================
*/

#include "engine/exports/plan_json.hpp"

#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <vector>

namespace plugplan::exports {

namespace {

std::string json_escape(const std::string& s) {
  std::ostringstream o;
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          const auto u = static_cast<unsigned char>(c);
          o << "\\u00" << hex[u >> 4] << hex[u & 0x0F];
        } else {
          o << c;
        }
    }
  }
  o << '"';
  return o.str();
}

struct J {
  std::ostringstream out;
  int indent = 2;
  int level = 0;

  void nl() {
    out << "\n" << std::string(level * indent, ' ');
  }

  void obj_begin() { out << "{"; level++; }
  void obj_end()   { level--; nl(); out << "}"; }

  void arr_begin() { out << "["; level++; }
  void arr_end()   { level--; nl(); out << "]"; }

  void key(const std::string& k) {
    out << json_escape(k) << ": ";
  }

  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void b(bool v) { out << (v ? "true" : "false"); }
  void n_null() { out << "null"; }

  // Canonical number text; integers carry no fraction.
  void num(double v) {
    if (!std::isfinite(v)) { n_null(); return; }
    out << format_number(v);
  }

  void num_i(int v) { out << v; }

  void num_opt(const std::optional<double>& v) { if (v) num(*v); else n_null(); }
  void int_opt(const std::optional<int>& v) { if (v) num_i(*v); else n_null(); }
  void str_opt(const std::optional<std::string>& v) { if (v) str(*v); else n_null(); }

  // Empty arrays stay on one line.
  void str_list(const std::vector<std::string>& v) {
    arr_begin();
    if (v.empty()) { level--; out << "]"; return; }
    for (size_t i = 0; i < v.size(); ++i) {
      nl(); str(v[i]);
      if (i + 1 < v.size()) comma();
    }
    arr_end();
  }
};

void emit_value(J& j, const Value& v) {
  switch (v.kind()) {
    case Value::Kind::kNull: j.n_null(); return;
    case Value::Kind::kBool: j.b(v.as_bool()); return;
    case Value::Kind::kNumber: j.num(v.as_number()); return;
    case Value::Kind::kString: j.str(v.as_string()); return;
    case Value::Kind::kList: {
      j.arr_begin();
      if (v.size() == 0) { j.level--; j.out << "]"; return; }
      for (size_t i = 0; i < v.size(); ++i) {
        j.nl(); emit_value(j, v.at(i));
        if (i + 1 < v.size()) j.comma();
      }
      j.arr_end();
      return;
    }
    case Value::Kind::kMap: {
      j.obj_begin();
      if (v.size() == 0) { j.level--; j.out << "}"; return; }
      for (size_t i = 0; i < v.keys().size(); ++i) {
        j.nl(); j.key(v.keys()[i]); emit_value(j, v.item(i));
        if (i + 1 < v.keys().size()) j.comma();
      }
      j.obj_end();
      return;
    }
  }
}

void emit_field_resolution(J& j, const policy::FieldResolution& fr) {
  j.obj_begin(); j.nl();
  j.key("method"); j.str(policy::to_string(fr.method)); j.comma(); j.nl();
  j.key("requested_field"); j.str(fr.requested_field); j.comma(); j.nl();
  j.key("matched_field"); j.str_opt(fr.matched_field); j.comma(); j.nl();
  j.key("matched_in_county"); j.str_opt(fr.matched_in_county); j.comma(); j.nl();
  j.key("nearest_distance_km"); j.num_opt(fr.nearest_distance_km);
  j.obj_end();
}

void emit_slurry(J& j, const materials::SlurrySummary& s) {
  j.obj_begin(); j.nl();
  j.key("recipe_id"); j.str(s.recipe_id); j.comma(); j.nl();
  j.key("cement_class"); j.str(s.cement_class); j.comma(); j.nl();
  j.key("density_ppg"); j.num(s.density_ppg); j.comma(); j.nl();
  j.key("yield_ft3_per_sk"); j.num(s.yield_ft3_per_sk); j.comma(); j.nl();
  j.key("sacks"); j.num_i(s.sacks); j.comma(); j.nl();
  j.key("total_bbl"); j.num(s.total_bbl); j.comma(); j.nl();
  j.key("ft3"); j.num(s.ft3); j.comma(); j.nl();
  j.key("water_bbl"); j.num(s.water_bbl); j.comma(); j.nl();
  j.key("additives"); j.arr_begin();
  for (size_t i = 0; i < s.additives.size(); ++i) {
    j.nl(); j.obj_begin(); j.nl();
    j.key("name"); j.str(s.additives[i].name); j.comma(); j.nl();
    j.key("amount"); j.num(s.additives[i].amount); j.comma(); j.nl();
    j.key("unit"); j.str(s.additives[i].unit);
    j.obj_end();
    if (i + 1 < s.additives.size()) j.comma();
  }
  if (s.additives.empty()) { j.level--; j.out << "]"; } else { j.arr_end(); }
  j.obj_end();
}

template <typename T, typename Fn>
void emit_array(J& j, const std::vector<T>& items, Fn fn) {
  j.arr_begin();
  if (items.empty()) { j.level--; j.out << "]"; return; }
  for (size_t i = 0; i < items.size(); ++i) {
    j.nl(); fn(j, items[i]);
    if (i + 1 < items.size()) j.comma();
  }
  j.arr_end();
}

// Segments are written with the step's depth convention: top_ft is the deeper end.
void emit_segment(J& j, const materials::SegmentVolume& v) {
  j.obj_begin(); j.nl();
  j.key("top_ft"); j.num(v.hi_ft); j.comma(); j.nl();
  j.key("bottom_ft"); j.num(v.lo_ft); j.comma(); j.nl();
  j.key("length_ft"); j.num(v.length_ft()); j.comma(); j.nl();
  j.key("outer_in"); j.num(v.outer_in); j.comma(); j.nl();
  j.key("inner_in"); j.num(v.inner_in); j.comma(); j.nl();
  j.key("cap_bbl_per_ft"); j.num(v.capacity_bbl_per_ft); j.comma(); j.nl();
  j.key("excess_used"); j.num(v.excess_used); j.comma(); j.nl();
  j.key("bbl"); j.num(v.bbl);
  j.obj_end();
}

void emit_materials(J& j, const materials::MaterialsResult& m) {
  j.obj_begin(); j.nl();
  j.key("sacks"); j.int_opt(m.sacks); j.comma(); j.nl();
  j.key("total_bbl"); j.num(m.total_bbl); j.comma(); j.nl();
  j.key("squeeze_bbl"); j.num_opt(m.squeeze_bbl); j.comma(); j.nl();
  j.key("cap_bbl"); j.num_opt(m.cap_bbl); j.comma(); j.nl();
  j.key("annular_capacity_bbl_per_ft"); j.num(m.annular_capacity_bbl_per_ft); j.comma(); j.nl();
  j.key("excess_used"); j.num_opt(m.excess_used); j.comma(); j.nl();
  j.key("segments"); emit_array(j, m.segments, emit_segment); j.comma(); j.nl();
  j.key("fluids"); j.obj_begin(); j.nl();
  j.key("displacement_bbl"); j.num_opt(m.displacement_bbl); j.comma(); j.nl();
  j.key("spacer_bbl"); j.num_opt(m.spacer_bbl);
  j.obj_end(); j.comma(); j.nl();
  j.key("unavailable_reason");
  if (m.unavailable_reason.empty()) j.n_null(); else j.str(m.unavailable_reason);
  j.comma(); j.nl();
  j.key("slurry");
  if (m.slurry) emit_slurry(j, *m.slurry); else j.n_null();
  j.obj_end();
}

void emit_step(J& j, const plan::Step& s) {
  j.obj_begin(); j.nl();
  j.key("step_id"); j.num_i(s.step_id); j.comma(); j.nl();
  j.key("type"); j.str(plan::to_string(s.type)); j.comma(); j.nl();
  j.key("top_ft"); j.num(s.top_ft); j.comma(); j.nl();
  j.key("bottom_ft"); j.num_opt(s.bottom_ft); j.comma(); j.nl();
  j.key("cement_class");
  if (s.cement_class.empty()) j.n_null(); else j.str(s.cement_class);
  j.comma(); j.nl();
  j.key("sacks"); j.int_opt(s.sacks); j.comma(); j.nl();
  j.key("formation");
  if (s.formation.empty()) j.n_null(); else j.str(s.formation);
  j.comma(); j.nl();
  j.key("tag_required"); j.b(s.tag_required); j.comma(); j.nl();
  j.key("regulatory_basis"); j.str_list(s.regulatory_basis); j.comma(); j.nl();
  j.key("details"); emit_value(j, s.details); j.comma(); j.nl();
  j.key("materials");
  if (s.materials) emit_materials(j, *s.materials); else j.n_null();
  j.obj_end();
}

void emit_violation(J& j, const plan::Violation& v) {
  j.obj_begin(); j.nl();
  j.key("severity"); j.str(plan::to_string(v.severity)); j.comma(); j.nl();
  j.key("rule_id"); j.str(v.rule_id); j.comma(); j.nl();
  j.key("message"); j.str(v.message); j.comma(); j.nl();
  j.key("context"); j.str(v.context);
  j.obj_end();
}

void emit_row(J& j, const plan::RrcExportRow& r) {
  j.obj_begin(); j.nl();
  j.key("plug_no"); j.int_opt(r.plug_no); j.comma(); j.nl();
  j.key("step_id"); j.num_i(r.step_id); j.comma(); j.nl();
  j.key("type"); j.str(r.type); j.comma(); j.nl();
  j.key("mechanical_type"); j.str(r.mechanical_type); j.comma(); j.nl();
  j.key("regulatory_purpose"); j.str(r.regulatory_purpose); j.comma(); j.nl();
  j.key("from_ft"); j.num(r.from_ft); j.comma(); j.nl();
  j.key("to_ft"); j.num(r.to_ft); j.comma(); j.nl();
  j.key("sacks"); j.int_opt(r.sacks); j.comma(); j.nl();
  j.key("cement_class");
  if (r.cement_class.empty()) j.n_null(); else j.str(r.cement_class);
  j.comma(); j.nl();
  j.key("wait_hours"); j.num_opt(r.wait_hours); j.comma(); j.nl();
  j.key("tag_required"); j.b(r.tag_required); j.comma(); j.nl();
  j.key("toc_ft"); j.num_opt(r.toc_ft); j.comma(); j.nl();
  j.key("additional_operations"); j.str_list(r.additional_operations); j.comma(); j.nl();
  j.key("remarks"); j.str(r.remarks);
  j.obj_end();
}

} // namespace

std::string value_to_json(const Value& v, int indent_spaces) {
  J j;
  j.indent = indent_spaces;
  emit_value(j, v);
  j.out << "\n";
  return j.out.str();
}

std::string plan_to_json(const plan::Plan& p, int indent_spaces) {
  J j;
  j.indent = indent_spaces;

  j.obj_begin(); j.nl();
  j.key("kernel_version"); j.str(p.kernel_version); j.comma(); j.nl();
  j.key("fingerprint"); j.str(p.fingerprint); j.comma(); j.nl();
  j.key("api14"); j.str(p.api14); j.comma(); j.nl();

  j.key("policy"); j.obj_begin(); j.nl();
  j.key("policy_id"); j.str(p.policy_id); j.comma(); j.nl();
  j.key("policy_version"); j.str(p.policy_version); j.comma(); j.nl();
  j.key("jurisdiction"); j.str(p.jurisdiction); j.comma(); j.nl();
  j.key("form"); j.str(p.form); j.comma(); j.nl();
  j.key("district"); j.str_opt(p.district); j.comma(); j.nl();
  j.key("county"); j.str_opt(p.county); j.comma(); j.nl();
  j.key("field"); j.str_opt(p.field); j.comma(); j.nl();
  j.key("complete"); j.b(p.policy_complete); j.comma(); j.nl();
  j.key("incomplete_reasons"); j.str_list(p.incomplete_reasons); j.comma(); j.nl();
  j.key("field_resolution"); emit_field_resolution(j, p.field_resolution);
  j.obj_end(); j.comma(); j.nl();

  j.key("steps"); emit_array(j, p.steps, emit_step); j.comma(); j.nl();
  j.key("violations"); emit_array(j, p.violations, emit_violation); j.comma(); j.nl();

  j.key("materials_totals"); j.obj_begin(); j.nl();
  j.key("total_sacks"); j.int_opt(p.materials_totals.total_sacks); j.comma(); j.nl();
  j.key("total_bbl"); j.num_opt(p.materials_totals.total_bbl);
  j.obj_end(); j.comma(); j.nl();

  j.key("rrc_export"); emit_array(j, p.rrc_export, emit_row); j.comma(); j.nl();
  j.key("formations_targeted"); j.str_list(p.formations_targeted); j.comma(); j.nl();
  j.key("formation_tops_detected"); j.str_list(p.formation_tops_detected); j.comma(); j.nl();
  j.key("plan_notes"); j.str_list(p.plan_notes); j.comma(); j.nl();
  j.key("operational_instructions"); j.str_list(p.operational_instructions); j.comma(); j.nl();
  j.key("long_plug_merge_applied"); j.b(p.long_plug_merge_applied);
  j.obj_end();

  j.out << "\n";
  return j.out.str();
}

std::string effective_policy_to_json(const policy::EffectivePolicy& p, int indent_spaces) {
  J j;
  j.indent = indent_spaces;

  j.obj_begin(); j.nl();
  j.key("policy_id"); j.str(p.policy_id); j.comma(); j.nl();
  j.key("policy_version"); j.str(p.version); j.comma(); j.nl();
  j.key("jurisdiction"); j.str(p.jurisdiction); j.comma(); j.nl();
  j.key("form"); j.str(p.form); j.comma(); j.nl();
  j.key("district"); j.str_opt(p.district); j.comma(); j.nl();
  j.key("county"); j.str_opt(p.county); j.comma(); j.nl();
  j.key("field"); j.str_opt(p.field); j.comma(); j.nl();
  j.key("field_resolution"); emit_field_resolution(j, p.field_resolution); j.comma(); j.nl();
  j.key("layers_applied"); j.str_list(p.layers_applied); j.comma(); j.nl();
  j.key("complete"); j.b(p.complete); j.comma(); j.nl();
  j.key("incomplete_reasons"); j.str_list(p.incomplete_reasons); j.comma(); j.nl();
  j.key("effective"); emit_value(j, p.effective);
  j.obj_end();

  j.out << "\n";
  return j.out.str();
}

bool write_text_file(const std::string& file_path, const std::string& content) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << content;
  f.close();
  return static_cast<bool>(f);
}

} // namespace plugplan::exports

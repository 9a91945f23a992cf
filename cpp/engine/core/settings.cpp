#include "engine/core/settings.hpp"

#include <initializer_list>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/value.hpp"
#include "engine/core/yaml_value.hpp"

namespace plugplan {

namespace {

void require_range(double v, double lo, double hi, const char* what) {
  PLUGPLAN_ENSURE(v >= lo && v <= hi, ErrorCode::kInvalidArgument,
                  std::string(what) + " outside sane bounds [" + format_number(lo) + ", " +
                      format_number(hi) + "]: " + format_number(v));
}

struct NumberField {
  const char* key;
  double* target;
};

void read_section(const Value& root, const char* section, std::initializer_list<NumberField> fields) {
  const Value* s = root.find(section);
  if (s == nullptr || s->is_null()) return;
  PLUGPLAN_ENSURE(s->is_map(), ErrorCode::kParseError, std::string("settings.") + section + " must be a map");

  for (const std::string& k : s->keys()) {
    bool known = false;
    for (const NumberField& f : fields) {
      if (k != f.key) continue;
      const auto v = s->find(k)->number_or_none();
      PLUGPLAN_ENSURE(v.has_value(), ErrorCode::kParseError,
                      std::string("settings.") + section + "." + k + " must be numeric");
      *f.target = *v;
      known = true;
      break;
    }
    PLUGPLAN_ENSURE(known, ErrorCode::kParseError, std::string("unknown settings key ") + section + "." + k);
  }
}

} // namespace

void PlacementSettings::validate_or_throw() const {
  require_range(bridge_plug_offset_ft, 0.0, 500.0, "placement.bridge_plug_offset_ft");
  require_range(kop_offset_ft, 0.0, 1000.0, "placement.kop_offset_ft");
  require_range(cibp_clearance_in, 0.0, 2.0, "placement.cibp_clearance_in");
  require_range(device_isolation_half_ft, 1.0, 1000.0, "placement.device_isolation_half_ft");
}

void PlugLengthSettings::validate_or_throw() const {
  require_range(default_cibp_cap_ft, 1.0, 1000.0, "lengths.default_cibp_cap_ft");
  require_range(squeeze_cap_length_ft, 1.0, 1000.0, "lengths.squeeze_cap_length_ft");
  require_range(squeeze_max_length_ft, 1.0, 5000.0, "lengths.squeeze_max_length_ft");
  require_range(formation_plug_half_ft, 1.0, 1000.0, "lengths.formation_plug_half_ft");
  require_range(productive_horizon_half_ft, 1.0, 1000.0, "lengths.productive_horizon_half_ft");
  require_range(shoe_plug_min_ft, 1.0, 2000.0, "lengths.shoe_plug_min_ft");
  require_range(uqw_below_base_ft, 0.0, 1000.0, "lengths.uqw_below_base_ft");
  require_range(uqw_above_base_ft, 0.0, 1000.0, "lengths.uqw_above_base_ft");
  require_range(top_plug_length_ft, 1.0, 500.0, "lengths.top_plug_length_ft");
  require_range(casing_cut_below_surface_ft, 0.0, 50.0, "lengths.casing_cut_below_surface_ft");
}

void MaterialsSettings::validate_or_throw() const {
  require_range(default_annular_excess, 0.0, 2.0, "materials.default_annular_excess");
  require_range(open_hole_diameter_add_in, 0.0, 12.0, "materials.open_hole_diameter_add_in");
}

void VerificationSettings::validate_or_throw() const {
  require_range(default_tag_wait_hr, 0.0, 72.0, "verification.default_tag_wait_hr");
  for (const auto& t : tag_required_step_types) {
    PLUGPLAN_ENSURE(!t.empty(), ErrorCode::kInvalidArgument,
                    "verification.tag_required_step_types contains an empty entry");
  }
}

void EngineSettings::validate_or_throw() const {
  placement.validate_or_throw();
  lengths.validate_or_throw();
  materials.validate_or_throw();
  verification.validate_or_throw();
  PLUGPLAN_ENSURE(!kernel_version.empty(), ErrorCode::kInvalidArgument, "kernel_version must be non-empty");
}

EngineSettings load_engine_settings(const std::string& path) {
  const Value root = load_yaml_file(path);
  EngineSettings s;
  if (root.is_null()) {
    s.validate_or_throw();
    return s;
  }
  PLUGPLAN_ENSURE(root.is_map(), ErrorCode::kParseError, path + ": settings root must be a map");

  for (const std::string& k : root.keys()) {
    if (k != "placement" && k != "lengths" && k != "materials" && k != "verification" && k != "kernel_version") {
      PLUGPLAN_THROW(ErrorCode::kParseError, path + ": unknown settings section " + k);
    }
  }

  read_section(root, "placement", {
      {"bridge_plug_offset_ft", &s.placement.bridge_plug_offset_ft},
      {"kop_offset_ft", &s.placement.kop_offset_ft},
      {"cibp_clearance_in", &s.placement.cibp_clearance_in},
      {"device_isolation_half_ft", &s.placement.device_isolation_half_ft},
  });
  read_section(root, "lengths", {
      {"default_cibp_cap_ft", &s.lengths.default_cibp_cap_ft},
      {"squeeze_cap_length_ft", &s.lengths.squeeze_cap_length_ft},
      {"squeeze_max_length_ft", &s.lengths.squeeze_max_length_ft},
      {"formation_plug_half_ft", &s.lengths.formation_plug_half_ft},
      {"productive_horizon_half_ft", &s.lengths.productive_horizon_half_ft},
      {"shoe_plug_min_ft", &s.lengths.shoe_plug_min_ft},
      {"uqw_below_base_ft", &s.lengths.uqw_below_base_ft},
      {"uqw_above_base_ft", &s.lengths.uqw_above_base_ft},
      {"top_plug_length_ft", &s.lengths.top_plug_length_ft},
      {"casing_cut_below_surface_ft", &s.lengths.casing_cut_below_surface_ft},
  });
  read_section(root, "materials", {
      {"default_annular_excess", &s.materials.default_annular_excess},
      {"open_hole_diameter_add_in", &s.materials.open_hole_diameter_add_in},
  });

  if (const Value* v = root.find("verification"); v != nullptr && v->is_map()) {
    for (const std::string& k : v->keys()) {
      const Value& item = *v->find(k);
      if (k == "default_tag_wait_hr") {
        const auto n = item.number_or_none();
        PLUGPLAN_ENSURE(n.has_value(), ErrorCode::kParseError, "verification.default_tag_wait_hr must be numeric");
        s.verification.default_tag_wait_hr = *n;
      } else if (k == "tag_required_step_types") {
        PLUGPLAN_ENSURE(item.is_list(), ErrorCode::kParseError, "verification.tag_required_step_types must be a list");
        s.verification.tag_required_step_types.clear();
        for (size_t i = 0; i < item.size(); ++i) {
          s.verification.tag_required_step_types.push_back(item.at(i).text_or_empty());
        }
      } else {
        PLUGPLAN_THROW(ErrorCode::kParseError, "unknown settings key verification." + k);
      }
    }
  }

  if (const Value* kv = root.find("kernel_version"); kv != nullptr && kv->present()) {
    s.kernel_version = kv->text_or_empty();
  }

  s.validate_or_throw();
  log(LogLevel::INFO, "engine settings loaded from " + path);
  return s;
}

} // namespace plugplan

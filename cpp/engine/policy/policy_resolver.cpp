#include "engine/policy/policy_resolver.hpp"

#include <algorithm>
#include <tuple>

#include "engine/core/logging.hpp"
#include "engine/policy/names.hpp"

namespace plugplan::policy {

namespace {

constexpr const char* kRequiredSections[] = {"citations", "requirements", "cement_class"};
constexpr const char* kRequiredRequirementKnobs[] = {
    "casing_shoe_coverage_ft", "duqw_coverage_ft", "tag_wait_hours"};
constexpr const char* kRequiredCementClassKeys[] = {"cutoff_ft", "shallow_class", "deep_class"};

bool has_text(const std::optional<std::string>& s) {
  return s.has_value() && s->find_first_not_of(" \t\r\n") != std::string::npos;
}

// A knob may be a bare scalar or {value, citation_keys}.
bool knob_present(const Value* v) {
  if (v == nullptr) return false;
  if (v->is_map()) {
    const Value* inner = v->find("value");
    return inner != nullptr && inner->present();
  }
  return v->present();
}

struct Candidate {
  double distance_km = 0.0;
  std::string county;
  const Value* layer = nullptr;
};

class Resolution {
 public:
  Resolution(const PolicyPack& pack, const CentroidTable& centroids, EffectivePolicy& out)
      : pack_(pack), centroids_(centroids), out_(out) {}

  void apply(const Value& layer_doc, std::string label) {
    out_.effective = deep_merge(out_.effective, extract_layer(layer_doc));
    log(LogLevel::DEBUG, "policy layer applied: " + label);
    out_.layers_applied.push_back(std::move(label));
  }

  const Value* apply_district(const std::string& raw) {
    const auto code = normalize_district(raw);
    if (!code) {
      out_.incomplete_reasons.push_back("district:" + raw + " unrecognized");
      log(LogLevel::WARN, "district code '" + raw + "' is not recognizable; district overlays skipped");
      return nullptr;
    }
    out_.district = *code;
    if (const Value* stub = pack_.district_stub(*code)) apply(*stub, "district_stub:" + *code);
    const Value* auto_doc = pack_.district_overlay(*code);
    if (auto_doc) apply(*auto_doc, "district:" + *code + "__auto");
    return auto_doc;
  }

  const Value* apply_county(const std::string& county) {
    if (!out_.district) return nullptr;
    std::string origin;
    const Value* layer = pack_.county_layer(*out_.district, county, &origin);
    if (layer != nullptr) apply(*layer, "county:" + origin);
    return layer;
  }

  void resolve_field(const std::string& field, const std::string& county, const Value* county_layer) {
    FieldResolution& fr = out_.field_resolution;
    fr.requested_field = field;

    if (county_layer != nullptr) {
      if (const Value* fields = county_layer->find("fields"); fields != nullptr && fields->is_map()) {
        for (size_t i = 0; i < fields->keys().size(); ++i) {
          const std::string& key = fields->keys()[i];
          if (!field_names_match(key, field)) continue;
          fr.method = FieldResolutionMethod::kExactInCounty;
          fr.matched_field = key;
          fr.matched_in_county = normalize_county_key(county);
          apply(fields->item(i), "field:" + key + "@" + normalize_county_key(county));
          return;
        }
      }
    }

    const std::vector<Candidate> candidates = nearby_counties(county);

    for (const Candidate& c : candidates) {
      const Value* fields = c.layer->find("fields");
      if (fields == nullptr || !fields->is_map()) continue;
      for (size_t i = 0; i < fields->keys().size(); ++i) {
        const std::string& key = fields->keys()[i];
        if (!field_names_equal(key, field)) continue;
        fr.method = FieldResolutionMethod::kNearestCounty;
        fr.matched_field = key;
        fr.matched_in_county = c.county;
        fr.nearest_distance_km = c.distance_km;
        apply(fields->item(i), "field:" + key + "@" + c.county);
        return;
      }
    }

    for (const Candidate& c : candidates) {
      if (!mentions(*c.layer, field, normalize_field_name)) continue;
      fr.method = FieldResolutionMethod::kNearestCountyOccurrence;
      fr.matched_in_county = c.county;
      fr.nearest_distance_km = c.distance_km;
      if (const Value* fields = c.layer->find("fields"); fields != nullptr && fields->is_map()) {
        for (size_t i = 0; i < fields->keys().size(); ++i) {
          if (!field_names_match(fields->keys()[i], field)) continue;
          fr.matched_field = fields->keys()[i];
          apply(fields->item(i), "field:" + fields->keys()[i] + "@" + c.county);
          break;
        }
      }
      return;
    }

    fr.method = FieldResolutionMethod::kNone;
  }

 private:
  std::vector<Candidate> nearby_counties(const std::string& county) const {
    std::vector<Candidate> out;
    if (!out_.district || county.empty()) return out;
    const auto origin = centroids_.find(county);
    if (!origin) {
      log(LogLevel::DEBUG, "no centroid for county '" + county + "'; nearest-county strategies unavailable");
      return out;
    }

    const std::string self = normalize_county_key(county);
    for (const std::string& cand : pack_.counties_in_district(*out_.district)) {
      if (cand == self) continue;
      const auto p = centroids_.find(cand);
      if (!p) continue;
      const Value* layer = pack_.county_layer(*out_.district, cand);
      if (layer == nullptr) continue;
      out.push_back({haversine_km(*origin, *p), cand, layer});
    }
    std::sort(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) {
      return std::tie(a.distance_km, a.county) < std::tie(b.distance_km, b.county);
    });
    return out;
  }

  const PolicyPack& pack_;
  const CentroidTable& centroids_;
  EffectivePolicy& out_;
};

} // namespace

const char* to_string(FieldResolutionMethod m) noexcept {
  switch (m) {
    case FieldResolutionMethod::kExactInCounty:           return "exact_in_county";
    case FieldResolutionMethod::kNearestCounty:           return "nearest_county";
    case FieldResolutionMethod::kNearestCountyOccurrence: return "nearest_county_occurrence";
    case FieldResolutionMethod::kNone:                    return "none";
    default:                                              return "none";
  }
}

std::vector<std::string> missing_required_keys(const Value& scope_doc,
                                               const std::string& scope,
                                               const std::optional<std::string>& district) {
  std::vector<std::string> missing;

  for (const char* k : kRequiredSections) {
    if (scope_doc.find(k) == nullptr) missing.push_back(scope + "." + k);
  }
  const Value* req = scope_doc.find("requirements");
  for (const char* k : kRequiredRequirementKnobs) {
    if (!knob_present(req ? req->find(k) : nullptr)) missing.push_back(scope + ".requirements." + k);
  }
  const Value* cc = scope_doc.find("cement_class");
  for (const char* k : kRequiredCementClassKeys) {
    if (!knob_present(cc ? cc->find(k) : nullptr)) missing.push_back(scope + ".cement_class." + k);
  }

  if (district) {
    for (auto& m : missing) m += " [district:" + *district + "]";
  }
  return missing;
}

EffectivePolicy resolve(const PolicyPack& pack, const CentroidTable& centroids, const ResolveRequest& req) {
  EffectivePolicy out;
  out.policy_id = pack.policy_id;
  out.version = pack.version;
  out.jurisdiction = pack.jurisdiction;
  out.form = pack.form;
  out.base = pack.base;
  out.effective = pack.base;
  out.layers_applied.push_back("base");

  Resolution r(pack, centroids, out);

  const Value* county_layer = nullptr;
  if (has_text(req.district)) {
    r.apply_district(*req.district);
  }
  if (has_text(req.county)) {
    out.county = *req.county;
    county_layer = r.apply_county(*req.county);
  }
  if (has_text(req.field)) {
    out.field = *req.field;
    r.resolve_field(*req.field, out.county.value_or(std::string()), county_layer);
    log(LogLevel::DEBUG, std::string("field '") + *req.field + "' resolved via " +
                             to_string(out.field_resolution.method));
  }

  std::vector<std::string> reasons = missing_required_keys(out.base, "base", out.district);
  if (out.district) {
    const auto eff = missing_required_keys(out.effective, "effective", out.district);
    reasons.insert(reasons.end(), eff.begin(), eff.end());
  }
  out.incomplete_reasons.insert(out.incomplete_reasons.end(), reasons.begin(), reasons.end());
  out.complete = out.incomplete_reasons.empty();

  if (!out.complete) {
    log(LogLevel::WARN, "effective policy " + out.policy_id + " incomplete: " +
                            std::to_string(out.incomplete_reasons.size()) + " missing key(s)");
  }
  return out;
}

} // namespace plugplan::policy

/*
================================================================================
Fragment 3.3 — Policy: Policy Pack Store (Implementation)
FILE: cpp/engine/policy/policy_pack.cpp
================================================================================
*/

#include "engine/policy/policy_pack.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/yaml_value.hpp"
#include "engine/policy/names.hpp"

namespace plugplan::policy {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kAutoSuffix = "auto";

bool is_layer_section(std::string_view k) {
  return std::find(kLayerSections.begin(), kLayerSections.end(), k) != kLayerSections.end();
}

std::string text_of(const Value& root, std::string_view key) {
  const Value* v = root.find(key);
  return v ? v->text_or_empty() : std::string();
}

// "8A__Andrews" -> "08a__andrews"; empty when the district part is unusable.
std::string normalize_stem(std::string_view stem) {
  const size_t sep = stem.find("__");
  if (sep == std::string_view::npos) return std::string();
  const auto d = normalize_district(stem.substr(0, sep));
  if (!d) return std::string();
  const std::string rest = county_file_slug(stem.substr(sep + 2));
  if (rest.empty()) return std::string();
  return *d + "__" + rest;
}

PolicyPack build_pack(const Value& root, const std::map<std::string, Value>& raw_overlays, std::string label) {
  PLUGPLAN_ENSURE(root.is_map(), ErrorCode::kParseError, label + ": policy pack root must be a map");

  PolicyPack pack;
  pack.source = std::move(label);
  pack.policy_id = text_of(root, "policy_id");
  pack.version = text_of(root, "version");
  if (pack.version.empty()) pack.version = text_of(root, "policy_version");
  pack.jurisdiction = text_of(root, "jurisdiction");
  pack.form = text_of(root, "form");
  pack.effective_from = text_of(root, "effective_from");

  PLUGPLAN_ENSURE(!pack.policy_id.empty(), ErrorCode::kParseError, pack.source + ": policy_id is required");

  const Value* base = root.find("base");
  PLUGPLAN_ENSURE(base != nullptr && base->is_map(), ErrorCode::kParseError, pack.source + ": base must be a map");
  pack.base = *base;

  if (const Value* stubs = root.find("district_overlays"); stubs != nullptr && !stubs->is_null()) {
    PLUGPLAN_ENSURE(stubs->is_map(), ErrorCode::kParseError, pack.source + ": district_overlays must be a map");
    for (size_t i = 0; i < stubs->keys().size(); ++i) {
      const std::string& raw = stubs->keys()[i];
      const auto code = normalize_district(raw);
      if (!code) {
        pack.rejected_stems.push_back("district_overlays." + raw);
        continue;
      }
      const Value& layer = stubs->item(i);
      PLUGPLAN_ENSURE(layer.is_map() || layer.is_null(), ErrorCode::kParseError,
                      pack.source + ": district_overlays." + raw + " must be a map");
      pack.district_stubs[*code] = deep_merge(pack.district_stubs[*code], layer);
    }
  }

  for (const auto& [stem, doc] : raw_overlays) {
    const std::string key = normalize_stem(stem);
    if (key.empty()) {
      log(LogLevel::WARN, "policy pack " + pack.source + ": ignoring overlay with unusable name '" + stem + "'");
      pack.rejected_stems.push_back(stem);
      continue;
    }
    PLUGPLAN_ENSURE(doc.is_map() || doc.is_null(), ErrorCode::kParseError,
                    pack.source + ": overlay " + stem + " root must be a map");
    pack.overlays[key] = doc.is_null() ? Value::map() : doc;
  }

  return pack;
}

} // namespace

Value extract_layer(const Value& doc) {
  Value out = Value::map();
  if (!doc.is_map()) return out;
  for (size_t i = 0; i < doc.keys().size(); ++i) {
    const std::string& k = doc.keys()[i];
    if (is_layer_section(k) && doc.item(i).is_map()) out.set(k, doc.item(i));
  }
  return out;
}

const Value* PolicyPack::district_stub(std::string_view district) const {
  auto it = district_stubs.find(std::string(district));
  return it == district_stubs.end() ? nullptr : &it->second;
}

const Value* PolicyPack::district_overlay(std::string_view district) const {
  auto it = overlays.find(std::string(district) + "__" + std::string(kAutoSuffix));
  return it == overlays.end() ? nullptr : &it->second;
}

const Value* PolicyPack::county_layer(std::string_view district, std::string_view county, std::string* origin) const {
  const std::string slug = county_file_slug(county);
  if (slug.empty()) return nullptr;

  const std::string file_key = std::string(district) + "__" + slug;
  if (slug != kAutoSuffix) {
    if (auto it = overlays.find(file_key); it != overlays.end()) {
      if (origin) *origin = file_key;
      return &it->second;
    }
  }

  const Value* auto_doc = district_overlay(district);
  const Value* counties = auto_doc ? auto_doc->find("counties") : nullptr;
  if (counties == nullptr || !counties->is_map()) return nullptr;

  const std::string label_prefix = std::string(district) + "__auto#";
  auto hit = [&](const std::string& key) -> const Value* {
    const Value* v = counties->find(key);
    if (v != nullptr && origin) *origin = label_prefix + key;
    return v;
  };

  // Exact spelling, then the "X County" alias.
  if (const Value* v = hit(std::string(county))) return v;
  if (const Value* v = hit(std::string(county) + " County")) return v;

  const std::string want = normalize_county_key(county);
  for (const std::string& k : counties->keys()) {
    if (normalize_county_key(k) == want) return hit(k);
  }
  for (const std::string& k : counties->keys()) {
    const std::string nk = normalize_county_key(k);
    if (!nk.empty() && (nk.find(want) != std::string::npos || want.find(nk) != std::string::npos)) return hit(k);
  }
  return nullptr;
}

std::vector<std::string> PolicyPack::counties_in_district(std::string_view district) const {
  std::set<std::string> out;
  const std::string prefix = std::string(district) + "__";
  for (const auto& [stem, doc] : overlays) {
    if (stem.rfind(prefix, 0) != 0) continue;
    std::string slug = stem.substr(prefix.size());
    if (slug == kAutoSuffix) continue;
    std::replace(slug.begin(), slug.end(), '_', ' ');
    out.insert(slug);
  }
  if (const Value* auto_doc = district_overlay(district)) {
    if (const Value* counties = auto_doc->find("counties"); counties != nullptr && counties->is_map()) {
      for (const std::string& k : counties->keys()) {
        const std::string nk = normalize_county_key(k);
        if (!nk.empty()) out.insert(nk);
      }
    }
  }
  return {out.begin(), out.end()};
}

PolicyPack load_policy_pack(const std::string& base_path) {
  const Value root = load_yaml_file(base_path);

  std::map<std::string, Value> raw;
  const fs::path dir = fs::path(base_path).parent_path() / "district_overlays";
  std::error_code ec;
  if (fs::is_directory(dir, ec)) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
      if (!entry.is_regular_file()) continue;
      const std::string ext = entry.path().extension().string();
      if (ext == ".yml" || ext == ".yaml") files.push_back(entry.path());
    }
    PLUGPLAN_ENSURE(!ec, ErrorCode::kIoError, "cannot list " + dir.string() + ": " + ec.message());
    std::sort(files.begin(), files.end());
    for (const auto& f : files) {
      try {
        raw[f.stem().string()] = load_yaml_file(f.string());
      } catch (const Error& e) {
        log(LogLevel::ERROR, "policy overlay failed to load: " + e.message());
        throw;
      }
    }
  }

  PolicyPack pack = build_pack(root, raw, base_path);
  log(LogLevel::INFO, "policy pack " + pack.policy_id + " v" + pack.version + " loaded from " + base_path + " (" +
                          std::to_string(pack.overlays.size()) + " overlays, " +
                          std::to_string(pack.district_stubs.size()) + " district stubs)");
  return pack;
}

PolicyPack policy_pack_from_documents(std::string_view base_yaml,
                                      const std::map<std::string, std::string>& overlays,
                                      std::string_view label) {
  const std::string lbl(label);
  const Value root = parse_yaml_text(base_yaml, lbl);
  std::map<std::string, Value> raw;
  for (const auto& [stem, text] : overlays) {
    raw[stem] = parse_yaml_text(text, lbl + "/" + stem);
  }
  return build_pack(root, raw, lbl);
}

// ----------------------------- lint -------------------------------------------

namespace {

bool knob_wants_number(std::string_view name) {
  auto ends = [&](std::string_view suf) {
    return name.size() >= suf.size() && name.substr(name.size() - suf.size()) == suf;
  };
  return ends("_ft") || ends("_hours") || ends("_hr") || ends("_in") || ends("_ppg");
}

void lint_layer(const Value& doc, const std::string& where, bool allow_counties, bool allow_fields,
                std::vector<LintFinding>& out) {
  if (!doc.is_map()) return;

  static const std::set<std::string_view> kMetadata = {
      "district", "county", "field", "source", "notes", "metadata", "updated", "version"};

  for (size_t i = 0; i < doc.keys().size(); ++i) {
    const std::string& k = doc.keys()[i];
    if (is_layer_section(k) || kMetadata.count(k) != 0) continue;
    if (allow_counties && k == "counties") continue;
    if (allow_fields && k == "fields") continue;
    out.push_back({where, "unknown section '" + k + "'"});
  }

  if (const Value* req = doc.find("requirements"); req != nullptr && req->is_map()) {
    for (size_t i = 0; i < req->keys().size(); ++i) {
      const std::string& name = req->keys()[i];
      const Value& knob = req->item(i);
      const Value& v = (knob.is_map() && knob.find("value") != nullptr) ? *knob.find("value") : knob;
      if (knob_wants_number(name) && v.present() && !v.number_or_none().has_value()) {
        out.push_back({where + ".requirements." + name, "expected a numeric value, found '" + v.text_or_empty() + "'"});
      }
    }
  }

  if (const Value* ov = doc.find("overrides"); ov != nullptr && ov->is_map()) {
    if (const Value* tops = ov->find("formation_tops"); tops != nullptr && tops->is_list()) {
      for (size_t i = 0; i < tops->size(); ++i) {
        const Value* f = tops->at(i).find("formation");
        if (f == nullptr || !f->present()) {
          out.push_back({where + ".overrides.formation_tops[" + std::to_string(i) + "]", "entry has no formation name"});
        }
      }
    }
    if (const Value* pi = ov->find("protect_intervals"); pi != nullptr && pi->is_list()) {
      for (size_t i = 0; i < pi->size(); ++i) {
        const Value* t = pi->at(i).find("top_ft");
        const Value* b = pi->at(i).find("bottom_ft");
        const auto tv = t ? t->number_or_none() : std::nullopt;
        const auto bv = b ? b->number_or_none() : std::nullopt;
        if (!tv || !bv) {
          out.push_back({where + ".overrides.protect_intervals[" + std::to_string(i) + "]", "top_ft/bottom_ft must be numeric"});
        } else if (*tv > *bv) {
          // Overlays write intervals in geological order: top_ft is the shallower depth.
          out.push_back({where + ".overrides.protect_intervals[" + std::to_string(i) + "]", "top_ft is deeper than bottom_ft"});
        }
      }
    }
  }

  if (allow_fields) {
    if (const Value* fields = doc.find("fields"); fields != nullptr && fields->is_map()) {
      for (size_t i = 0; i < fields->keys().size(); ++i) {
        lint_layer(fields->item(i), where + ".fields." + fields->keys()[i], false, false, out);
      }
    }
  }
  if (allow_counties) {
    if (const Value* counties = doc.find("counties"); counties != nullptr && counties->is_map()) {
      for (size_t i = 0; i < counties->keys().size(); ++i) {
        lint_layer(counties->item(i), where + ".counties." + counties->keys()[i], false, true, out);
      }
    }
  }
}

} // namespace

std::vector<LintFinding> lint_policy_pack(const PolicyPack& pack) {
  std::vector<LintFinding> out;
  for (const auto& stem : pack.rejected_stems) {
    out.push_back({stem, "overlay name does not start with a recognizable district code"});
  }
  lint_layer(pack.base, "base", false, false, out);
  for (const auto& [code, layer] : pack.district_stubs) {
    lint_layer(layer, "district_overlays." + code, false, false, out);
  }
  for (const auto& [stem, doc] : pack.overlays) {
    const bool is_auto = stem.size() > 6 && stem.substr(stem.size() - 6) == "__auto";
    lint_layer(doc, stem, is_auto, !is_auto, out);
  }
  return out;
}

} // namespace plugplan::policy

#pragma once
/*
================================================================================
Fragment 3.3 — Policy: Policy Pack Store
FILE: cpp/engine/policy/policy_pack.hpp

Purpose:
  - Immutable, eagerly loaded policy pack: base document, inline district
    stubs, and every overlay file found in the sibling district_overlays/
    directory. Loaded once per process (or per policy-version bump) and passed
    by const reference into resolver calls.

On-disk layout:
  <pack>/base.yaml                    policy_id, version, jurisdiction, form,
                                      base{...}, district_overlays{code: layer}
  <pack>/district_overlays/08a__auto.yml      district layer (+ counties{})
  <pack>/district_overlays/08a__andrews.yml   county layer  (+ fields{})

Hardening:
  - Malformed YAML anywhere in the pack is fatal (Error{kParseError}); this
    is a deployment error, never a per-well one.
  - Overlay stems are normalized at load ("8a__auto" -> "08a__auto").
  - Stems whose district part cannot be normalized are kept out of the index
    and reported by lint_policy_pack().
================================================================================
*/

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/value.hpp"

namespace plugplan::policy {

// Sections a layer may contribute to the effective policy. Everything else in
// an overlay document (counties, fields, metadata) stays out of the merge.
inline constexpr std::array<std::string_view, 6> kLayerSections = {
    "citations", "requirements", "cement_class", "preferences", "overrides", "steps_overrides"};

// Copy of `doc` restricted to kLayerSections (map sections only).
Value extract_layer(const Value& doc);

struct PolicyPack {
  std::string policy_id;
  std::string version;
  std::string jurisdiction;
  std::string form;
  std::string effective_from;
  std::string source;

  Value base;
  std::map<std::string, Value> district_stubs;  // normalized code -> layer
  std::map<std::string, Value> overlays;        // normalized stem -> document
  std::vector<std::string> rejected_stems;

  const Value* district_stub(std::string_view district) const;
  const Value* district_overlay(std::string_view district) const;

  // County layer for a normalized district: "{d}__{slug}" file first, then the
  // counties{} entry of "{d}__auto". `origin` (optional) receives a label for
  // audit ("08a__andrews" or "08a__auto#Andrews").
  const Value* county_layer(std::string_view district, std::string_view county, std::string* origin = nullptr) const;

  // Normalized county keys known for a district (county files + counties{} keys).
  std::vector<std::string> counties_in_district(std::string_view district) const;
};

// `base_path` is the base.yaml file; overlays come from its sibling
// district_overlays/ directory when present.
PolicyPack load_policy_pack(const std::string& base_path);

// In-memory variant (tests, embedded packs). Keys of `overlays` are file stems.
PolicyPack policy_pack_from_documents(std::string_view base_yaml,
                                      const std::map<std::string, std::string>& overlays,
                                      std::string_view label);

struct LintFinding {
  std::string where;
  std::string message;
};

std::vector<LintFinding> lint_policy_pack(const PolicyPack& pack);

} // namespace plugplan::policy

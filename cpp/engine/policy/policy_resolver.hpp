#pragma once
/*
================================================================================
Fragment 3.4 — Policy: Hierarchical Policy Resolver
FILE: cpp/engine/policy/policy_resolver.hpp

Purpose:
  - Build the effective policy for one well: base < district < county < field,
    each layer applied with deep_merge() (maps recurse, scalars/lists replace).

Field resolution (first match wins):
  a) exact_in_county            fuzzy key match in the current county's fields{}
  b) nearest_county             nearest other county in the district (Haversine
                                over the centroid table) with an exact key
  c) nearest_county_occurrence  nearest county whose tree merely mentions the field
  otherwise none.

Hardening:
  - Never throws for incompleteness: missing knobs are returned as dotted
    paths in incomplete_reasons and complete=false.
  - Pure function of (pack, centroids, request); safe to call concurrently.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/core/value.hpp"
#include "engine/policy/geo.hpp"
#include "engine/policy/policy_pack.hpp"

namespace plugplan::policy {

enum class FieldResolutionMethod : int {
  kExactInCounty = 0,
  kNearestCounty = 1,
  kNearestCountyOccurrence = 2,
  kNone = 3,
};

const char* to_string(FieldResolutionMethod m) noexcept;

struct FieldResolution {
  FieldResolutionMethod method = FieldResolutionMethod::kNone;
  std::string requested_field;
  std::optional<std::string> matched_field;
  std::optional<std::string> matched_in_county;
  std::optional<double> nearest_distance_km;
};

struct ResolveRequest {
  std::optional<std::string> district;
  std::optional<std::string> county;
  std::optional<std::string> field;
};

struct EffectivePolicy {
  std::string policy_id;
  std::string version;
  std::string jurisdiction;
  std::string form;

  Value base;
  Value effective;

  std::optional<std::string> district;  // normalized
  std::optional<std::string> county;    // as requested
  std::optional<std::string> field;     // as requested

  FieldResolution field_resolution;
  std::vector<std::string> layers_applied;

  bool complete = false;
  std::vector<std::string> incomplete_reasons;
};

EffectivePolicy resolve(const PolicyPack& pack, const CentroidTable& centroids, const ResolveRequest& req);

// Missing required paths in one scope document, formatted
// "{scope}.{dotted.key}" plus " [district:{d}]" when a district is given.
std::vector<std::string> missing_required_keys(const Value& scope_doc,
                                               const std::string& scope,
                                               const std::optional<std::string>& district);

} // namespace plugplan::policy

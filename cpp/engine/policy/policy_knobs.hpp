#pragma once
/*
================================================================================
Fragment 3.5 — Policy: Typed Knobs (Post-Merge Materialization)
FILE: cpp/engine/policy/policy_knobs.hpp

Purpose:
  - Strict typed view of an EffectivePolicy, built only after the layered
    merge and completeness validation. Rules read knobs from here and never
    walk the dynamic tree themselves.

Knob shapes accepted under requirements{}:
  name: 100
  name: {value: 100, citation_keys: [tx.tac.16.3.14(e)(2)]}
Citation keys resolve through the effective citations{} map; unknown keys are
kept verbatim.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/value.hpp"
#include "engine/materials/material_engine.hpp"
#include "engine/materials/recipe.hpp"
#include "engine/policy/policy_resolver.hpp"

namespace plugplan::policy {

struct Knob {
  std::optional<double> value;
  std::vector<std::string> citations;
};

struct CementClassRule {
  std::optional<double> cutoff_ft;
  std::string shallow_class;
  std::string deep_class;

  // Midpoint shallower than the cutoff -> shallow class. Empty when unset.
  std::string pick(double midpoint_ft) const;
};

struct GeometryDefault {
  std::optional<double> casing_id_in;
  std::optional<double> stinger_od_in;
  std::optional<double> stinger_id_in;
  std::optional<double> hole_d_in;
  std::optional<double> annular_excess;
};

struct FormationRequirement {
  std::string formation;
  std::optional<double> top_ft;  // district fallback anchor
  bool plug_required = true;
  bool tag_required = false;
};

// Depth intervals in overlays are written {top_ft, bottom_ft} with top
// shallower; they are stored here as (shallow_ft, deep_ft).
struct ProtectInterval {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;
  std::string reason;
};

// One piece of a plug whose annulus changes with depth (e.g. across a shoe).
struct PlugSegment {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;
  GeometryDefault geometry;
};

struct CementPlugOverride {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;
  std::string geometry_context;
  GeometryDefault geometry;
  std::vector<PlugSegment> segments;
  std::optional<double> displacement_margin_bbl;
  std::optional<int> sacks;
  std::vector<std::string> citations;
  std::string note;
};

struct SqueezeOverride {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;
  std::optional<int> sacks_override;
  std::vector<std::string> citations;
};

struct PerfCirculateOverride {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;
  std::vector<std::string> citations;
};

struct OperationalInstructions {
  bool pump_via_tubing = false;
  std::optional<double> notice_hours;
  std::optional<double> mud_min_weight_ppg;
  std::optional<double> funnel_min_s;

  // Filing-facing sentences, in a fixed order.
  std::vector<std::string> render() const;
};

struct MergePreference {
  bool enabled = false;
  double threshold_ft = 500.0;
  std::vector<std::string> types = {"formation_top_plug"};
};

struct PolicyKnobs {
  std::string policy_id;
  std::optional<std::string> district;

  Value requirements;
  Value citations;

  CementClassRule cement_class;
  std::map<std::string, materials::CementRecipe> recipes;  // keyed by class
  std::optional<materials::CementRecipe> default_recipe;
  std::map<std::string, GeometryDefault> geometry_defaults;
  std::optional<double> annular_excess;
  std::optional<materials::SpacerSpec> spacer;  // squeeze pre-flush
  MergePreference merge;
  OperationalInstructions operational;

  // overrides{}
  bool tag_surface_shoe_in_oh = false;
  bool tagging_required_hint = false;
  std::vector<std::string> tag_formations;
  std::vector<FormationRequirement> formation_tops;
  std::vector<ProtectInterval> protect_intervals;
  std::optional<std::vector<std::string>> tag_required_step_types;

  // steps_overrides{}
  std::optional<double> cibp_cap_length_ft;
  std::optional<SqueezeOverride> squeeze_via_perf;
  std::vector<PerfCirculateOverride> perf_circulate;
  std::vector<CementPlugOverride> cement_plugs;

  Knob knob(std::string_view name) const;
  double number_or(std::string_view name, double fallback) const;
  std::vector<std::string> citations_for(std::string_view name) const;
  std::vector<std::string> resolve_citations(const Value& keys) const;

  // recipes[class], else default_recipe, else nullptr.
  const materials::CementRecipe* recipe_for(std::string_view cement_class) const;

  // geometry_defaults[step_type], else geometry_defaults["default"], else nullptr.
  const GeometryDefault* geometry_default_for(std::string_view step_type) const;

  bool formation_tagged(std::string_view formation) const;
};

PolicyKnobs materialize_knobs(const EffectivePolicy& policy);

} // namespace plugplan::policy

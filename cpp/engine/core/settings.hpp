#pragma once
/*
================================================================================
Fragment 1.4 — Core: Engine Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize the placement offsets and fallback lengths the step generator
    uses when a policy knob is absent. Policy knobs always win over these.
  - One validated object, passed by const reference into every compilation.

Hardening:
  - validate_or_throw() rejects nonsensical values early (Error{kInvalidArgument}).
  - load_engine_settings() reads an optional YAML file; unknown keys are
    rejected so typos cannot silently fall back to defaults.
================================================================================
*/

#include <string>
#include <vector>

namespace plugplan {

// ----------------------------- Placement --------------------------------------
// Fixed placement rules for mechanical barriers (ft unless noted).
struct PlacementSettings {
  // New CIBP sits this far above the producing top.
  double bridge_plug_offset_ft = 10.0;

  // KOP-based CIBP candidate sits this far above the kick-off point.
  double kop_offset_ft = 50.0;

  // Recommended CIBP OD = casing ID - clearance (in).
  double cibp_clearance_in = 0.25;

  // Packer / DV-tool isolation plug half length.
  double device_isolation_half_ft = 50.0;

  void validate_or_throw() const;
};

// ----------------------------- Plug lengths ------------------------------------
// Fallbacks for requirement knobs.
struct PlugLengthSettings {
  double default_cibp_cap_ft = 100.0;
  double squeeze_cap_length_ft = 50.0;
  double squeeze_max_length_ft = 100.0;
  double formation_plug_half_ft = 50.0;
  double productive_horizon_half_ft = 50.0;
  double shoe_plug_min_ft = 100.0;
  double uqw_below_base_ft = 50.0;
  double uqw_above_base_ft = 50.0;
  double top_plug_length_ft = 10.0;
  double casing_cut_below_surface_ft = 3.0;

  void validate_or_throw() const;
};

// ----------------------------- Materials ---------------------------------------
struct MaterialsSettings {
  double default_annular_excess = 0.4;

  // Stopgap open-hole estimate: casing OD + this (in) when hole size is unknown.
  double open_hole_diameter_add_in = 2.0;

  void validate_or_throw() const;
};

// ----------------------------- Verification ------------------------------------
struct VerificationSettings {
  double default_tag_wait_hr = 4.0;

  // Step types that are always tagged unless the policy says otherwise.
  std::vector<std::string> tag_required_step_types = {
      "bridge_plug_cap", "cibp_cap", "perforate_and_squeeze_plug"};

  void validate_or_throw() const;
};

struct EngineSettings {
  PlacementSettings placement;
  PlugLengthSettings lengths;
  MaterialsSettings materials;
  VerificationSettings verification;

  std::string kernel_version = "w3a-kernel-1.0";

  void validate_or_throw() const;
};

// Loads settings from YAML. Layout mirrors the struct:
//   placement: {bridge_plug_offset_ft: 10, ...}
//   lengths: {...}
//   materials: {...}
//   verification: {default_tag_wait_hr: 4, tag_required_step_types: [...]}
//   kernel_version: "w3a-kernel-1.0"
// Missing sections keep their defaults. The result is validated.
EngineSettings load_engine_settings(const std::string& path);

} // namespace plugplan

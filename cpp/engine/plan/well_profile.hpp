#pragma once
/*
================================================================================
Fragment 5.2 — Plan: Typed Well Profile
FILE: cpp/engine/plan/well_profile.hpp

Purpose:
  - Typed, alias-resolved view of the facts map that the generator rules read.
    Everything optional stays optional; nothing is defaulted here.

Depth convention:
  - DepthRange is physical measured depth: shallow_ft <= deep_ft. Intervals
    in facts may be given in either order and are normalized on read.
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/plan/facts.hpp"

namespace plugplan::plan {

struct DepthRange {
  double shallow_ft = 0.0;
  double deep_ft = 0.0;

  double length_ft() const noexcept { return deep_ft - shallow_ft; }
  double mid_ft() const noexcept { return 0.5 * (shallow_ft + deep_ft); }
  bool covers(const DepthRange& o) const noexcept { return shallow_ft <= o.shallow_ft && deep_ft >= o.deep_ft; }
};

struct AnnularGap {
  DepthRange range;
  bool requires_isolation = false;
  bool cement_present = false;
  std::string description;
};

struct FormationTop {
  std::string formation;
  double top_ft = 0.0;
};

struct WellProfile {
  std::string api14;
  std::string district;
  std::string county;
  std::string field;

  std::optional<double> surface_shoe_ft;
  std::optional<double> intermediate_shoe_ft;
  std::optional<double> production_shoe_ft;

  bool has_uqw = false;
  std::optional<double> uqw_base_ft;

  std::vector<DepthRange> producing_intervals;
  std::vector<FormationTop> formation_tops;  // by depth, then name

  std::vector<std::string> mechanical_barriers;  // upper-case tokens
  std::optional<double> existing_cibp_ft;
  std::optional<double> packer_ft;
  std::optional<double> dv_tool_ft;
  std::optional<double> kop_md_ft;
  std::optional<double> kop_tvd_ft;

  std::vector<AnnularGap> annular_gaps;
  std::vector<DepthRange> liners;

  std::optional<double> casing_id_in;
  std::optional<double> casing_od_in;
  std::optional<double> stinger_od_in;
  std::optional<double> stinger_id_in;
  std::optional<double> hole_size_in;

  bool has_barrier(std::string_view token) const;
  bool inside_liner(const DepthRange& r) const;
  std::optional<double> formation_top(std::string_view formation) const;

  // Interval with the deepest bottom; falls back to the deepest formation top
  // (as a zero-length range) when no producing interval is known.
  std::optional<DepthRange> deepest_producing_interval() const;
};

WellProfile build_well_profile(const WellFacts& facts);

} // namespace plugplan::plan

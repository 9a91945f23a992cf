#pragma once
/*
================================================================================
Fragment 4.2 — Materials: Capacity, Volume and Sack Math
FILE: cpp/engine/materials/material_engine.hpp

Purpose:
  - Pure functions turning plug geometry + a cement recipe into volumes and
    sack counts. No I/O, no policy lookups, no logging.

Formulas:
  - annular capacity (bbl/ft) = pi/4 * (D_outer^2 - D_inner^2) / 1029.4
  - squeeze bbl  = interval_ft * cap * squeeze_factor   (2.0 open hole, 1.5 cased)
  - cap bbl      = cap_len_ft * cap * (1 + 0.4)
  - standard bbl = interval_ft * cap * (1 + excess * (1 + 0.10 * depth_ft / 1000))
  - sacks        = ceil(total_bbl * 5.615 / yield)     (always rounded up)
  - segmented standard plug: sum over segments of
        length * cap(outer_i, inner_i) * (1 + excess_i scaled at segment depth)
  - displacement bbl = interval_ft * cap(stinger_id, 0) + margin
  - spacer bbl       = max(min_bbl, multiple * interval_ft * cap, contact_min * rate_bpm)

Hardening:
  - Missing geometry or recipe yields sacks = nullopt with a reason. Volumes
    are never fabricated from absent data.
  - Misuse (negative lengths, non-positive yield in sacks_for_bbl) throws
    Error{kInvalidArgument}.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "engine/materials/recipe.hpp"

namespace plugplan::materials {

inline constexpr double kSqueezeFactorOpenHole = 2.0;
inline constexpr double kSqueezeFactorCased = 1.5;
inline constexpr double kCapExcess = 0.4;
inline constexpr double kExcessDepthScalePerKft = 0.10;
inline constexpr int kMinimumPlugSacks = 25;

// bbl/ft; 0 when the inner diameter fills the outer one.
double annular_capacity_bbl_per_ft(double d_outer_in, double d_inner_in);

// Excess fraction scaled +10% per 1000 ft, multiplicatively.
double depth_scaled_excess(double excess, double depth_ft);

double squeeze_factor(bool open_hole) noexcept;

// ceil(total_bbl * 5.615 / yield); 0 for total_bbl <= 0.
int sacks_for_bbl(double total_bbl, double yield_ft3_per_sk);

SlurrySummary summarize_slurry(int sacks, double total_bbl, const CementRecipe& recipe);

// Inside-pipe capacity (bbl/ft) of a cylinder of diameter d.
double cylinder_capacity_bbl_per_ft(double d_in);

// Fluid pumped behind a balanced plug to spot it: the work string volume over
// the plug interval plus a margin.
double balanced_displacement_bbl(double interval_ft, double pipe_id_cap_bbl_per_ft, double margin_bbl = 0.0);

struct SpacerSpec {
  double min_bbl = 5.0;
  double spacer_multiple = 1.5;
  std::optional<double> contact_minutes;
  std::optional<double> pump_rate_bpm;
};

// Preflush ahead of the slurry: the largest of the floor, a multiple of the
// annular volume, and contact time x pump rate when both are given.
double spacer_bbl_for_interval(double interval_ft, double annulus_cap_bbl_per_ft, const SpacerSpec& spec);

// Stopgap open-hole diameter when the hole size is unknown.
double estimate_open_hole_diameter_in(double casing_od_in, double add_in) noexcept;

enum class PlugKind : int {
  kStandard = 0,  // balanced plug over an interval
  kCap = 1,       // cement cap on a mechanical barrier
  kSqueeze = 2,   // squeeze behind pipe + cap inside casing
};

// One piece of a plug whose annulus changes along its length (e.g. open hole
// below a shoe, casing above). Unset diameters fall back to PlugGeometry.
struct AnnulusSegment {
  double lo_ft = 0.0;
  double hi_ft = 0.0;
  std::optional<double> outer_in;
  std::optional<double> inner_in;
  std::optional<double> annular_excess;
};

struct SegmentVolume {
  double lo_ft = 0.0;
  double hi_ft = 0.0;
  double outer_in = 0.0;
  double inner_in = 0.0;
  double capacity_bbl_per_ft = 0.0;
  double excess_used = 0.0;
  double bbl = 0.0;
  double length_ft() const noexcept { return hi_ft - lo_ft; }
};

// Fully resolved segments only; throws Error{kInvalidArgument} on an empty or
// inverted segment or a missing diameter.
std::vector<SegmentVolume> integrate_annulus_over_segments(const std::vector<AnnulusSegment>& segments,
                                                           double default_excess);

// Cement geometry of one step as the materials engine sees it.
struct PlugSpec {
  PlugKind kind = PlugKind::kStandard;
  double interval_ft = 0.0;      // standard length, squeeze length, or cap length for kCap
  double depth_ft = 0.0;         // deepest point, for excess scaling
  double cap_length_ft = 0.0;    // kSqueeze only
  bool open_hole = false;        // kSqueeze only
  std::vector<AnnulusSegment> segments;  // kStandard only; replaces the single annulus when set
  double displacement_margin_bbl = 0.0;  // kStandard only
  std::optional<SpacerSpec> spacer;
};

struct PlugGeometry {
  std::optional<double> casing_id_in;
  std::optional<double> stinger_od_in;
  std::optional<double> stinger_id_in;     // displacement volume
  std::optional<double> hole_diameter_in;  // open-hole squeeze sections
  double annular_excess = 0.4;
};

struct MaterialsResult {
  std::optional<int> sacks;
  double total_bbl = 0.0;
  std::optional<double> squeeze_bbl;
  std::optional<double> cap_bbl;
  double annular_capacity_bbl_per_ft = 0.0;
  std::optional<double> excess_used;
  std::optional<SlurrySummary> slurry;
  std::vector<SegmentVolume> segments;
  std::optional<double> displacement_bbl;
  std::optional<double> spacer_bbl;

  // Non-empty when sacks could not be computed ("casing_id_in", "recipe", ...).
  std::string unavailable_reason;
};

// Squeeze + cap split for a squeeze plug with a known annular capacity.
struct SqueezeVolumes {
  double squeeze_bbl = 0.0;
  double cap_bbl = 0.0;
  double total_bbl() const noexcept { return squeeze_bbl + cap_bbl; }
};

SqueezeVolumes squeeze_volumes(double squeeze_ft,
                               double cap_ft,
                               double squeeze_cap_bbl_per_ft,
                               double cap_cap_bbl_per_ft,
                               bool open_hole);

MaterialsResult compute_sacks(const PlugSpec& spec, const PlugGeometry& geometry, const CementRecipe* recipe);

} // namespace plugplan::materials

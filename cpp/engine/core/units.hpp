#pragma once
/*
================================================================================
Fragment 1.10 — Core: Oilfield Units + Constants
FILE: cpp/engine/core/units.hpp

Purpose:
  - Oilfield volume conversions and the handful of constants the materials
    engine and geospatial resolver share, so no magic numbers leak into rules.
================================================================================
*/

namespace plugplan::units {

inline constexpr double pi = 3.14159265358979323846;

// Volume
inline constexpr double ft3_per_bbl = 5.615;
inline constexpr double gal_per_bbl = 42.0;

// Capacity of a 1 ft annulus in bbl/ft is (D^2 - d^2) / 1029.4 with D, d in inches.
inline constexpr double in2_ft_per_bbl = 1029.4;

// Geodesy
inline constexpr double earth_radius_km = 6371.0;
inline constexpr double deg_to_rad = pi / 180.0;

// Helpers
constexpr double sqr(double x) { return x * x; }

} // namespace plugplan::units

#pragma once
/*
================================================================================
Fragment 4.1 — Materials: Cement Recipes + Slurry Summary
FILE: cpp/engine/materials/recipe.hpp
================================================================================
*/

#include <string>
#include <vector>

namespace plugplan::materials {

struct Additive {
  std::string name;
  double rate_per_sack = 0.0;
  std::string unit;
};

struct CementRecipe {
  std::string id;
  std::string cement_class;
  double density_ppg = 0.0;
  double yield_ft3_per_sk = 0.0;
  double water_gal_per_sk = 0.0;
  std::vector<Additive> additives;

  // Usable for sack math: positive yield, non-negative water.
  bool usable() const noexcept {
    return yield_ft3_per_sk > 0.0 && water_gal_per_sk >= 0.0 && density_ppg >= 0.0;
  }
};

struct AdditiveTotal {
  std::string name;
  double amount = 0.0;
  std::string unit;
};

// Per-step slurry make-up derived from the recipe and the sack count.
struct SlurrySummary {
  std::string recipe_id;
  std::string cement_class;
  double density_ppg = 0.0;
  double yield_ft3_per_sk = 0.0;
  int sacks = 0;
  double total_bbl = 0.0;
  double ft3 = 0.0;
  double water_bbl = 0.0;
  std::vector<AdditiveTotal> additives;
};

} // namespace plugplan::materials

#pragma once
/*
================================================================================
Fragment 5.3 — Plan: Plugging Step
FILE: cpp/engine/plan/step.hpp

Purpose:
  - One plugging operation as it appears on the filing form.

Interval convention (From/To columns):
  - bottom_ft is the lower numeric depth, top_ft the upper (top_ft >= bottom_ft);
    "above" a depth means +. Point devices (bridge plug, retainer, casing cut)
    carry top_ft only.

Lifecycle:
  - Created by the generator rules, filled in by materials, possibly merged,
    then frozen by the assembler (step_id assigned there).
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/value.hpp"
#include "engine/materials/material_engine.hpp"

namespace plugplan::plan {

enum class StepType : int {
  kSurfaceCasingShoePlug = 0,
  kIntermediateCasingShoePlug,
  kUqwIsolationPlug,
  kProductiveHorizonIsolationPlug,
  kTopPlug,
  kCutCasingBelowSurface,
  kBridgePlug,
  kBridgePlugCap,
  kCibpCap,
  kCementRetainer,
  kPerforateAndSqueezePlug,
  kPerfCirculate,
  kMechanicalIsolationPlug,
  kFormationTopPlug,
  kCementPlug,
};

const char* to_string(StepType t) noexcept;
std::optional<StepType> step_type_from_string(std::string_view s) noexcept;

bool is_point_device(StepType t) noexcept;
bool is_cement_bearing(StepType t) noexcept;
bool is_cap(StepType t) noexcept;

// Exempt from the minimum-sack floor: mechanical devices and their caps.
bool is_sack_floor_exempt(StepType t) noexcept;

struct Step {
  StepType type = StepType::kCementPlug;
  double top_ft = 0.0;
  std::optional<double> bottom_ft;

  std::string cement_class;
  std::optional<int> sacks;
  std::vector<std::string> regulatory_basis;
  bool tag_required = false;
  std::string formation;

  Value details = Value::map();
  std::optional<materials::MaterialsResult> materials;

  int step_id = 0;

  double lo_ft() const noexcept { return bottom_ft ? *bottom_ft : top_ft; }
  double hi_ft() const noexcept { return top_ft; }
  double length_ft() const noexcept { return hi_ft() - lo_ft(); }
  double mid_ft() const noexcept { return 0.5 * (lo_ft() + hi_ft()); }

  // Sort key: bottom_ft, or top_ft for point devices.
  double depth_key() const noexcept { return lo_ft(); }

  // [lo, hi] fully inside `o`.
  bool within(const Step& o) const noexcept { return lo_ft() >= o.lo_ft() && hi_ft() <= o.hi_ft(); }
  bool spans(double depth_ft) const noexcept { return depth_ft >= lo_ft() && depth_ft <= hi_ft(); }

  bool materials_override() const noexcept;
  void add_basis(const std::vector<std::string>& cites);
};

// Interval step with lo <= hi regardless of argument order.
Step make_interval_step(StepType type, double a_ft, double b_ft);
Step make_point_step(StepType type, double depth_ft);

} // namespace plugplan::plan

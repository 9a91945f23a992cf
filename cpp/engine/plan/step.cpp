#include "engine/plan/step.hpp"

#include <algorithm>
#include <array>

namespace plugplan::plan {

namespace {

struct StepTypeName {
  StepType type;
  const char* name;
};

constexpr std::array<StepTypeName, 15> kStepTypeNames = {{
    {StepType::kSurfaceCasingShoePlug, "surface_casing_shoe_plug"},
    {StepType::kIntermediateCasingShoePlug, "intermediate_casing_shoe_plug"},
    {StepType::kUqwIsolationPlug, "uqw_isolation_plug"},
    {StepType::kProductiveHorizonIsolationPlug, "productive_horizon_isolation_plug"},
    {StepType::kTopPlug, "top_plug"},
    {StepType::kCutCasingBelowSurface, "cut_casing_below_surface"},
    {StepType::kBridgePlug, "bridge_plug"},
    {StepType::kBridgePlugCap, "bridge_plug_cap"},
    {StepType::kCibpCap, "cibp_cap"},
    {StepType::kCementRetainer, "cement_retainer"},
    {StepType::kPerforateAndSqueezePlug, "perforate_and_squeeze_plug"},
    {StepType::kPerfCirculate, "perf_circulate"},
    {StepType::kMechanicalIsolationPlug, "mechanical_isolation_plug"},
    {StepType::kFormationTopPlug, "formation_top_plug"},
    {StepType::kCementPlug, "cement_plug"},
}};

} // namespace

const char* to_string(StepType t) noexcept {
  for (const auto& e : kStepTypeNames) {
    if (e.type == t) return e.name;
  }
  return "unknown";
}

std::optional<StepType> step_type_from_string(std::string_view s) noexcept {
  for (const auto& e : kStepTypeNames) {
    if (s == e.name) return e.type;
  }
  return std::nullopt;
}

bool is_point_device(StepType t) noexcept {
  return t == StepType::kBridgePlug || t == StepType::kCementRetainer || t == StepType::kCutCasingBelowSurface;
}

// perf_circulate only opens a circulation path; no cement is pumped.
bool is_cement_bearing(StepType t) noexcept {
  return !is_point_device(t) && t != StepType::kPerfCirculate;
}

bool is_cap(StepType t) noexcept {
  return t == StepType::kBridgePlugCap || t == StepType::kCibpCap;
}

bool is_sack_floor_exempt(StepType t) noexcept {
  return t == StepType::kBridgePlug || t == StepType::kCementRetainer || is_cap(t);
}

bool Step::materials_override() const noexcept {
  const Value* v = details.find("materials_override");
  return v != nullptr && v->bool_or_none().value_or(false);
}

void Step::add_basis(const std::vector<std::string>& cites) {
  for (const std::string& c : cites) {
    if (c.empty()) continue;
    if (std::find(regulatory_basis.begin(), regulatory_basis.end(), c) == regulatory_basis.end()) {
      regulatory_basis.push_back(c);
    }
  }
}

Step make_interval_step(StepType type, double a_ft, double b_ft) {
  Step s;
  s.type = type;
  s.top_ft = std::max(a_ft, b_ft);
  s.bottom_ft = std::min(a_ft, b_ft);
  return s;
}

Step make_point_step(StepType type, double depth_ft) {
  Step s;
  s.type = type;
  s.top_ft = depth_ft;
  return s;
}

} // namespace plugplan::plan

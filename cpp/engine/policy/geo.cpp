#include "engine/policy/geo.hpp"

#include <cmath>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/units.hpp"
#include "engine/core/yaml_value.hpp"
#include "engine/policy/names.hpp"

namespace plugplan::policy {

double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept {
  const double lat1 = a.latitude_deg * units::deg_to_rad;
  const double lat2 = b.latitude_deg * units::deg_to_rad;
  const double dlat = lat2 - lat1;
  const double dlon = (b.longitude_deg - a.longitude_deg) * units::deg_to_rad;

  const double h = units::sqr(std::sin(dlat / 2.0)) +
                   std::cos(lat1) * std::cos(lat2) * units::sqr(std::sin(dlon / 2.0));
  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return units::earth_radius_km * c;
}

CentroidTable CentroidTable::from_value(const Value& rows, std::string_view source) {
  const std::string src(source);
  PLUGPLAN_ENSURE(rows.is_list(), ErrorCode::kParseError, src + ": centroid table must be a JSON array");

  CentroidTable t;
  for (size_t i = 0; i < rows.size(); ++i) {
    const Value& row = rows.at(i);
    const std::string where = src + "[" + std::to_string(i) + "]";
    PLUGPLAN_ENSURE(row.is_map(), ErrorCode::kParseError, where + ": row must be an object");

    const Value* county = row.find("county");
    const Value* lat = row.find("latitude");
    const Value* lon = row.find("longitude");
    PLUGPLAN_ENSURE(county != nullptr && county->present(), ErrorCode::kParseError, where + ": missing county");
    PLUGPLAN_ENSURE(lat != nullptr && lat->number_or_none().has_value(), ErrorCode::kParseError,
                    where + ": latitude must be numeric");
    PLUGPLAN_ENSURE(lon != nullptr && lon->number_or_none().has_value(), ErrorCode::kParseError,
                    where + ": longitude must be numeric");

    const GeoPoint p{*lat->number_or_none(), *lon->number_or_none()};
    PLUGPLAN_ENSURE(std::fabs(p.latitude_deg) <= 90.0 && std::fabs(p.longitude_deg) <= 180.0,
                    ErrorCode::kParseError, where + ": coordinate out of range");
    t.add(county->text_or_empty(), p);
  }
  return t;
}

CentroidTable CentroidTable::load_json_file(const std::string& path) {
  CentroidTable t = from_value(load_yaml_file(path), path);
  log(LogLevel::INFO, "loaded " + std::to_string(t.size()) + " county centroids from " + path);
  return t;
}

void CentroidTable::add(std::string_view county, GeoPoint p) {
  const std::string key = normalize_county_key(county);
  if (key.empty()) return;
  by_key_[key] = p;
  by_key_[key + " county"] = p;
  ++rows_;
}

std::optional<GeoPoint> CentroidTable::find(std::string_view county) const {
  auto it = by_key_.find(normalize_county_key(county));
  if (it == by_key_.end()) return std::nullopt;
  return it->second;
}

std::optional<double> CentroidTable::distance_km(std::string_view a, std::string_view b) const {
  const auto pa = find(a);
  const auto pb = find(b);
  if (!pa || !pb) return std::nullopt;
  return haversine_km(*pa, *pb);
}

} // namespace plugplan::policy

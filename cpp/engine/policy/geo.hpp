#pragma once
/*
================================================================================
Fragment 3.2 — Policy: County Centroids + Great-Circle Distance
FILE: cpp/engine/policy/geo.hpp

Purpose:
  - Immutable county-centroid table used by the nearest-county field
    resolution strategies. Loaded once, passed by const reference.

Indexing:
  - Each row is indexed under its normalized county key ("andrews") and the
    " county" variant ("andrews county"), so either spelling resolves.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/value.hpp"

namespace plugplan::policy {

struct GeoPoint {
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
};

// Haversine distance on a sphere of radius 6371 km.
double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept;

class CentroidTable {
 public:
  // rows: [{county, latitude, longitude}, ...]. Throws Error{kParseError}
  // on a malformed row or out-of-range coordinate.
  static CentroidTable from_value(const Value& rows, std::string_view source);
  static CentroidTable load_json_file(const std::string& path);

  void add(std::string_view county, GeoPoint p);

  std::optional<GeoPoint> find(std::string_view county) const;

  // nullopt if either county has no centroid.
  std::optional<double> distance_km(std::string_view a, std::string_view b) const;

  size_t size() const noexcept { return rows_; }
  bool empty() const noexcept { return rows_ == 0; }

 private:
  std::map<std::string, GeoPoint> by_key_;
  size_t rows_ = 0;
};

} // namespace plugplan::policy

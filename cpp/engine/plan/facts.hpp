#pragma once
/*
================================================================================
Fragment 5.1 — Plan: Well Facts
FILE: cpp/engine/plan/facts.hpp

Purpose:
  - Caller-supplied facts map: key -> {value, units, source, confidence}.
    The engine only reads facts; it never mutates them.

Accepted input shapes per key:
  surface_shoe_ft: 1210
  surface_shoe_ft: {value: 1210, units: ft, source: w2, confidence: 0.9}
Dotted keys ("kop.kop_md_ft") fall back to a path inside the "kop" fact.
================================================================================
*/

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "engine/core/value.hpp"

namespace plugplan::plan {

struct Fact {
  std::string key;
  Value value;
  std::string units;
  std::string source;
  std::optional<double> confidence;
};

class WellFacts {
 public:
  // Throws Error{kParseError} when `root` is not a map.
  static WellFacts from_value(const Value& root);
  static WellFacts load_file(const std::string& path);

  void set(Fact f);
  void set_value(std::string key, Value v);

  const Fact* find(std::string_view key) const;
  const Value* value(std::string_view key) const;

  std::optional<double> number(std::string_view key) const;
  std::optional<bool> flag(std::string_view key) const;
  std::string text(std::string_view key) const;

  const std::map<std::string, Fact, std::less<>>& all() const noexcept { return facts_; }

 private:
  std::map<std::string, Fact, std::less<>> facts_;
};

} // namespace plugplan::plan

#pragma once
/*
================================================================================
Fragment 1.7 — Core: YAML/JSON Loading into Value Trees
FILE: cpp/engine/core/yaml_value.hpp

Purpose:
  - One entry point for every document the engine reads (policy packs,
    overlays, centroid tables, facts, settings). JSON inputs go through the
    same parser since JSON is a YAML subset.

Hardening:
  - Any parser error becomes Error{kParseError} naming the source.
  - Unreadable files become Error{kIoError}.
  - Plain scalars infer null/bool/number; quoted scalars stay strings.
================================================================================
*/

#include <string>
#include <string_view>

#include "engine/core/value.hpp"

namespace YAML {
class Node;
}

namespace plugplan {

// `source` only labels error messages.
Value value_from_yaml(const YAML::Node& node, std::string_view source);

Value parse_yaml_text(std::string_view text, std::string_view source);

Value load_yaml_file(const std::string& path);

} // namespace plugplan

#pragma once
/*
================================================================================
Fragment 3.1 — Policy: Jurisdiction Name Normalization
FILE: cpp/engine/policy/names.hpp

Purpose:
  - Canonical forms for district codes, county names and field names so
    overlay lookup never depends on how a caller spelled them.

District codes:
  - Numeric part zero-padded to two digits, letter suffix defaults to "a":
      "8", "08", "8A", "08A", "District 08A" -> "08a";  "7C" -> "07c".
================================================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace plugplan::policy {

// nullopt when `raw` is not a recognizable district code.
std::optional<std::string> normalize_district(std::string_view raw);

// Lowercase, trimmed, whitespace collapsed, trailing " county" removed.
std::string normalize_county_key(std::string_view raw);

// File-name form used in "{district}__{county}.yml": normalized key with
// spaces replaced by underscores.
std::string county_file_slug(std::string_view raw);

// Lowercase, parentheticals removed, dash variants unified to '-',
// whitespace collapsed and trimmed.
std::string normalize_field_name(std::string_view raw);

// Letters and digits of the normalized name only.
std::string field_skeleton(std::string_view raw);

// Normalized equality (used for cross-county "exact key" matches).
bool field_names_equal(std::string_view a, std::string_view b);

// Fuzzy match: bidirectional substring of normalized names, or skeleton equality.
bool field_names_match(std::string_view a, std::string_view b);

} // namespace plugplan::policy

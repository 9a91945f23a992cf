#pragma once
/*
================================================================================
Fragment 1.6 — Core: Dynamic Value Tree
FILE: cpp/engine/core/value.hpp

Purpose:
  - JSON-like intermediate representation for policy layers and facts.
    Overlays are merged as generic trees and only materialized into typed
    structs after merge + completeness validation.

Design constraints:
  - Deterministic: map entries are kept sorted by key, so iteration order,
    serialization and hashing never depend on insertion order.
  - Value semantics (copyable, comparable). No shared ownership.

Hardening:
  - Typed accessors throw Error{kInvalidArgument} on kind mismatch; the
    optional-returning helpers (number_or_none, text_or_empty) never throw.
================================================================================
*/

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plugplan {

class Value {
 public:
  enum class Kind : int { kNull = 0, kBool, kNumber, kString, kList, kMap };

  Value() = default;

  static Value null() { return Value(); }
  static Value boolean(bool b);
  static Value number(double d);
  static Value string(std::string s);
  static Value list();
  static Value map();

  Kind kind() const noexcept { return kind_; }
  bool is_null() const noexcept { return kind_ == Kind::kNull; }
  bool is_bool() const noexcept { return kind_ == Kind::kBool; }
  bool is_number() const noexcept { return kind_ == Kind::kNumber; }
  bool is_string() const noexcept { return kind_ == Kind::kString; }
  bool is_list() const noexcept { return kind_ == Kind::kList; }
  bool is_map() const noexcept { return kind_ == Kind::kMap; }

  // Present = not null and not an empty string (policy knob presence rule).
  bool present() const noexcept;

  bool as_bool() const;
  double as_number() const;
  const std::string& as_string() const;

  // Lenient readers used on caller-supplied data.
  // number_or_none accepts numbers and numeric strings ("6815", " 4.5 ").
  std::optional<double> number_or_none() const noexcept;
  // bool_or_none accepts bools, 0/1 numbers and "true"/"false"/"yes"/"no".
  std::optional<bool> bool_or_none() const noexcept;
  // Strings verbatim, numbers/bools in canonical text form, else "".
  std::string text_or_empty() const;

  // ---- list ----
  size_t size() const noexcept;
  const Value& at(size_t i) const;
  void push_back(Value v);

  // ---- map ----
  const Value* find(std::string_view key) const noexcept;
  Value* find(std::string_view key) noexcept;
  // Dotted lookup through nested maps ("requirements.tag_wait_hours").
  const Value* find_path(std::string_view dotted) const noexcept;
  bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
  Value& set(std::string key, Value v);
  bool erase(std::string_view key);
  const std::vector<std::string>& keys() const noexcept { return keys_; }
  // Map value i (same order as keys()), or list element i.
  const Value& item(size_t i) const { return at(i); }

  bool operator==(const Value& o) const;
  bool operator!=(const Value& o) const { return !(*this == o); }

 private:
  size_t lower_bound(std::string_view key) const noexcept;

  Kind kind_ = Kind::kNull;
  bool b_ = false;
  double n_ = 0.0;
  std::string s_;
  std::vector<std::string> keys_;  // sorted; map only
  std::vector<Value> items_;       // list elements, or map values parallel to keys_
};

// Layered-configuration merge: maps recurse, everything else in `upper`
// replaces `lower` (lists replace, they never append).
Value deep_merge(const Value& lower, const Value& upper);

// Pre-order walk. The callback receives the map key the node sits under
// (nullptr for the root and list elements) and the node itself.
using ValueVisitor = std::function<void(const std::string* key, const Value& node)>;
void visit(const Value& root, const ValueVisitor& fn);

// True if any map key or scalar string anywhere in the tree contains
// `needle` after both sides are passed through `normalize`.
bool mentions(const Value& root,
              std::string_view needle,
              const std::function<std::string(std::string_view)>& normalize);

// Canonical number text: integers without a fraction, others with up to
// 6 significant decimals and trailing zeros stripped.
std::string format_number(double v);

} // namespace plugplan

/*
================================================================================
Fragment 1.6 — Core: Dynamic Value Tree (Implementation)
FILE: cpp/engine/core/value.cpp
================================================================================
*/

#include "engine/core/value.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "engine/core/error.hpp"

namespace plugplan {

namespace {

const char* kind_name(Value::Kind k) {
  switch (k) {
    case Value::Kind::kNull:   return "null";
    case Value::Kind::kBool:   return "bool";
    case Value::Kind::kNumber: return "number";
    case Value::Kind::kString: return "string";
    case Value::Kind::kList:   return "list";
    case Value::Kind::kMap:    return "map";
    default:                   return "unknown";
  }
}

std::string trim_copy(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return std::string(s.substr(b, e - b));
}

} // namespace

Value Value::boolean(bool b) {
  Value v;
  v.kind_ = Kind::kBool;
  v.b_ = b;
  return v;
}

Value Value::number(double d) {
  Value v;
  v.kind_ = Kind::kNumber;
  v.n_ = d;
  return v;
}

Value Value::string(std::string s) {
  Value v;
  v.kind_ = Kind::kString;
  v.s_ = std::move(s);
  return v;
}

Value Value::list() {
  Value v;
  v.kind_ = Kind::kList;
  return v;
}

Value Value::map() {
  Value v;
  v.kind_ = Kind::kMap;
  return v;
}

bool Value::present() const noexcept {
  if (kind_ == Kind::kNull) return false;
  if (kind_ == Kind::kString && s_.empty()) return false;
  return true;
}

bool Value::as_bool() const {
  PLUGPLAN_ENSURE(kind_ == Kind::kBool, ErrorCode::kInvalidArgument,
                  std::string("expected bool, found ") + kind_name(kind_));
  return b_;
}

double Value::as_number() const {
  PLUGPLAN_ENSURE(kind_ == Kind::kNumber, ErrorCode::kInvalidArgument,
                  std::string("expected number, found ") + kind_name(kind_));
  return n_;
}

const std::string& Value::as_string() const {
  PLUGPLAN_ENSURE(kind_ == Kind::kString, ErrorCode::kInvalidArgument,
                  std::string("expected string, found ") + kind_name(kind_));
  return s_;
}

std::optional<double> Value::number_or_none() const noexcept {
  if (kind_ == Kind::kNumber) {
    if (!std::isfinite(n_)) return std::nullopt;
    return n_;
  }
  if (kind_ != Kind::kString) return std::nullopt;

  const std::string t = trim_copy(s_);
  if (t.empty()) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
  return v;
}

std::optional<bool> Value::bool_or_none() const noexcept {
  if (kind_ == Kind::kBool) return b_;
  if (kind_ == Kind::kNumber) {
    if (n_ == 0.0) return false;
    if (n_ == 1.0) return true;
    return std::nullopt;
  }
  if (kind_ != Kind::kString) return std::nullopt;

  std::string t = trim_copy(s_);
  for (char& c : t) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (t == "true" || t == "yes" || t == "y" || t == "1") return true;
  if (t == "false" || t == "no" || t == "n" || t == "0") return false;
  return std::nullopt;
}

std::string Value::text_or_empty() const {
  switch (kind_) {
    case Kind::kString: return s_;
    case Kind::kNumber: return format_number(n_);
    case Kind::kBool:   return b_ ? "true" : "false";
    default:            return std::string();
  }
}

size_t Value::size() const noexcept {
  if (kind_ == Kind::kList || kind_ == Kind::kMap) return items_.size();
  return 0;
}

const Value& Value::at(size_t i) const {
  PLUGPLAN_ENSURE(kind_ == Kind::kList || kind_ == Kind::kMap, ErrorCode::kInvalidArgument,
                  std::string("indexed access on ") + kind_name(kind_));
  PLUGPLAN_ENSURE(i < items_.size(), ErrorCode::kOutOfRange,
                  "index " + std::to_string(i) + " out of range (size " + std::to_string(items_.size()) + ")");
  return items_[i];
}

void Value::push_back(Value v) {
  if (kind_ == Kind::kNull) kind_ = Kind::kList;
  PLUGPLAN_ENSURE(kind_ == Kind::kList, ErrorCode::kInvalidArgument,
                  std::string("push_back on ") + kind_name(kind_));
  items_.push_back(std::move(v));
}

size_t Value::lower_bound(std::string_view key) const noexcept {
  auto it = std::lower_bound(keys_.begin(), keys_.end(), key,
                             [](const std::string& a, std::string_view b) { return std::string_view(a) < b; });
  return static_cast<size_t>(it - keys_.begin());
}

const Value* Value::find(std::string_view key) const noexcept {
  if (kind_ != Kind::kMap) return nullptr;
  const size_t i = lower_bound(key);
  if (i < keys_.size() && keys_[i] == key) return &items_[i];
  return nullptr;
}

Value* Value::find(std::string_view key) noexcept {
  if (kind_ != Kind::kMap) return nullptr;
  const size_t i = lower_bound(key);
  if (i < keys_.size() && keys_[i] == key) return &items_[i];
  return nullptr;
}

const Value* Value::find_path(std::string_view dotted) const noexcept {
  const Value* cur = this;
  size_t start = 0;
  while (cur != nullptr) {
    const size_t dot = dotted.find('.', start);
    const std::string_view part = dotted.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    cur = cur->find(part);
    if (dot == std::string_view::npos) break;
    start = dot + 1;
  }
  return cur;
}

Value& Value::set(std::string key, Value v) {
  if (kind_ == Kind::kNull) kind_ = Kind::kMap;
  PLUGPLAN_ENSURE(kind_ == Kind::kMap, ErrorCode::kInvalidArgument,
                  std::string("set(\"") + key + "\") on " + kind_name(kind_));
  const size_t i = lower_bound(key);
  if (i < keys_.size() && keys_[i] == key) {
    items_[i] = std::move(v);
    return items_[i];
  }
  keys_.insert(keys_.begin() + static_cast<std::ptrdiff_t>(i), std::move(key));
  items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(i), std::move(v));
  return items_[i];
}

bool Value::erase(std::string_view key) {
  if (kind_ != Kind::kMap) return false;
  const size_t i = lower_bound(key);
  if (i >= keys_.size() || keys_[i] != key) return false;
  keys_.erase(keys_.begin() + static_cast<std::ptrdiff_t>(i));
  items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(i));
  return true;
}

bool Value::operator==(const Value& o) const {
  if (kind_ != o.kind_) return false;
  switch (kind_) {
    case Kind::kNull:   return true;
    case Kind::kBool:   return b_ == o.b_;
    case Kind::kNumber: return n_ == o.n_;
    case Kind::kString: return s_ == o.s_;
    case Kind::kList:   return items_ == o.items_;
    case Kind::kMap:    return keys_ == o.keys_ && items_ == o.items_;
    default:            return false;
  }
}

Value deep_merge(const Value& lower, const Value& upper) {
  if (!lower.is_map() || !upper.is_map()) return upper;

  Value out = lower;
  const auto& keys = upper.keys();
  for (size_t i = 0; i < keys.size(); ++i) {
    const Value& incoming = upper.item(i);
    const Value* existing = out.find(keys[i]);
    if (existing != nullptr && existing->is_map() && incoming.is_map()) {
      out.set(keys[i], deep_merge(*existing, incoming));
    } else {
      out.set(keys[i], incoming);
    }
  }
  return out;
}

namespace {

void visit_node(const std::string* key, const Value& node, const ValueVisitor& fn) {
  fn(key, node);
  if (node.is_map()) {
    const auto& keys = node.keys();
    for (size_t i = 0; i < keys.size(); ++i) visit_node(&keys[i], node.item(i), fn);
  } else if (node.is_list()) {
    for (size_t i = 0; i < node.size(); ++i) visit_node(nullptr, node.at(i), fn);
  }
}

} // namespace

void visit(const Value& root, const ValueVisitor& fn) {
  visit_node(nullptr, root, fn);
}

bool mentions(const Value& root,
              std::string_view needle,
              const std::function<std::string(std::string_view)>& normalize) {
  const std::string n = normalize(needle);
  if (n.empty()) return false;

  bool found = false;
  visit(root, [&](const std::string* key, const Value& node) {
    if (found) return;
    if (key != nullptr && normalize(*key).find(n) != std::string::npos) {
      found = true;
      return;
    }
    if (node.is_string() && normalize(node.as_string()).find(n) != std::string::npos) {
      found = true;
    }
  });
  return found;
}

std::string format_number(double v) {
  if (!std::isfinite(v)) return "null";
  if (v == 0.0) return "0";
  if (std::fabs(v) < 1e15 && v == std::floor(v)) {
    std::ostringstream o;
    o << static_cast<long long>(v);
    return o.str();
  }
  std::ostringstream o;
  o.setf(std::ios::fixed);
  o << std::setprecision(6) << v;
  std::string s = o.str();
  while (!s.empty() && s.back() == '0') s.pop_back();
  if (!s.empty() && s.back() == '.') s.pop_back();
  return s;
}

} // namespace plugplan

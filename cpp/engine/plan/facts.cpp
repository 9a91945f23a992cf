#include "engine/plan/facts.hpp"

#include "engine/core/error.hpp"
#include "engine/core/yaml_value.hpp"

namespace plugplan::plan {

WellFacts WellFacts::from_value(const Value& root) {
  PLUGPLAN_ENSURE(root.is_map(), ErrorCode::kParseError, "facts document must be a map of fact-key -> fact");

  WellFacts out;
  for (size_t i = 0; i < root.keys().size(); ++i) {
    const std::string& key = root.keys()[i];
    const Value& entry = root.item(i);

    Fact f;
    f.key = key;
    const Value* inner = entry.is_map() ? entry.find("value") : nullptr;
    if (inner != nullptr) {
      f.value = *inner;
      if (const Value* u = entry.find("units")) f.units = u->text_or_empty();
      if (const Value* s = entry.find("source")) f.source = s->text_or_empty();
      if (const Value* c = entry.find("confidence")) f.confidence = c->number_or_none();
    } else {
      f.value = entry;
    }
    out.set(std::move(f));
  }
  return out;
}

WellFacts WellFacts::load_file(const std::string& path) {
  return from_value(load_yaml_file(path));
}

void WellFacts::set(Fact f) {
  std::string key = f.key;
  facts_[std::move(key)] = std::move(f);
}

void WellFacts::set_value(std::string key, Value v) {
  Fact f;
  f.key = key;
  f.value = std::move(v);
  set(std::move(f));
}

const Fact* WellFacts::find(std::string_view key) const {
  auto it = facts_.find(key);
  return it == facts_.end() ? nullptr : &it->second;
}

const Value* WellFacts::value(std::string_view key) const {
  if (const Fact* f = find(key)) return &f->value;

  const size_t dot = key.find('.');
  if (dot == std::string_view::npos) return nullptr;
  const Fact* head = find(key.substr(0, dot));
  if (head == nullptr) return nullptr;
  return head->value.find_path(key.substr(dot + 1));
}

std::optional<double> WellFacts::number(std::string_view key) const {
  const Value* v = value(key);
  return v ? v->number_or_none() : std::nullopt;
}

std::optional<bool> WellFacts::flag(std::string_view key) const {
  const Value* v = value(key);
  return v ? v->bool_or_none() : std::nullopt;
}

std::string WellFacts::text(std::string_view key) const {
  const Value* v = value(key);
  return v ? v->text_or_empty() : std::string();
}

} // namespace plugplan::plan

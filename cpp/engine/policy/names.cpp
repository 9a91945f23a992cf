#include "engine/policy/names.hpp"

#include <cctype>

namespace plugplan::policy {

namespace {

std::string lower_ascii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

std::string collapse_ws(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// UTF-8 dash variants: hyphen U+2010, figure dash U+2012, en dash U+2013,
// em dash U+2014, minus sign U+2212.
std::string unify_dashes(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const auto c0 = static_cast<unsigned char>(s[i]);
    if (c0 == 0xE2 && i + 2 < s.size()) {
      const auto c1 = static_cast<unsigned char>(s[i + 1]);
      const auto c2 = static_cast<unsigned char>(s[i + 2]);
      const bool general_punct_dash = c1 == 0x80 && (c2 == 0x90 || c2 == 0x92 || c2 == 0x93 || c2 == 0x94);
      const bool minus_sign = c1 == 0x88 && c2 == 0x92;
      if (general_punct_dash || minus_sign) {
        out.push_back('-');
        i += 2;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

} // namespace

std::optional<std::string> normalize_district(std::string_view raw) {
  std::string s = lower_ascii(raw);
  std::string compact;
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) compact.push_back(c);
  }
  if (compact.rfind("district", 0) == 0) compact.erase(0, 8);
  if (compact.empty()) return std::nullopt;

  size_t i = 0;
  std::string digits;
  while (i < compact.size() && std::isdigit(static_cast<unsigned char>(compact[i]))) digits.push_back(compact[i++]);
  if (digits.empty()) return std::nullopt;

  std::string rest = compact.substr(i);
  if (rest == ".0") rest.clear();  // "8.0" from untyped numeric sources
  char letter = 'a';
  if (rest.size() == 1 && std::isalpha(static_cast<unsigned char>(rest[0]))) {
    letter = rest[0];
  } else if (!rest.empty()) {
    return std::nullopt;
  }

  while (digits.size() > 2 && digits[0] == '0') digits.erase(0, 1);
  if (digits.size() > 2) return std::nullopt;
  if (digits.size() == 1) digits.insert(digits.begin(), '0');
  if (digits == "00") return std::nullopt;

  return digits + letter;
}

std::string normalize_county_key(std::string_view raw) {
  std::string s = collapse_ws(lower_ascii(raw));
  if (ends_with(s, " county")) s.erase(s.size() - 7);
  while (!s.empty() && s.back() == ' ') s.pop_back();
  return s;
}

std::string county_file_slug(std::string_view raw) {
  std::string s = normalize_county_key(raw);
  for (char& c : s) {
    if (c == ' ') c = '_';
  }
  return s;
}

std::string normalize_field_name(std::string_view raw) {
  const std::string s = unify_dashes(lower_ascii(raw));
  std::string no_paren;
  no_paren.reserve(s.size());
  int depth = 0;
  for (char c : s) {
    if (c == '(') { ++depth; continue; }
    if (c == ')') { if (depth > 0) --depth; continue; }
    if (depth == 0) no_paren.push_back(c);
  }
  return collapse_ws(no_paren);
}

std::string field_skeleton(std::string_view raw) {
  const std::string n = normalize_field_name(raw);
  std::string out;
  for (char c : n) {
    if (std::isalnum(static_cast<unsigned char>(c))) out.push_back(c);
  }
  return out;
}

bool field_names_equal(std::string_view a, std::string_view b) {
  const std::string na = normalize_field_name(a);
  return !na.empty() && na == normalize_field_name(b);
}

bool field_names_match(std::string_view a, std::string_view b) {
  const std::string na = normalize_field_name(a);
  const std::string nb = normalize_field_name(b);
  if (na.empty() || nb.empty()) return false;
  if (na.find(nb) != std::string::npos || nb.find(na) != std::string::npos) return true;
  const std::string sa = field_skeleton(a);
  return !sa.empty() && sa == field_skeleton(b);
}

} // namespace plugplan::policy

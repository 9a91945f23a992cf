#include "engine/core/yaml_value.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "engine/core/error.hpp"

namespace plugplan {

namespace {

bool is_null_word(const std::string& s) {
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool parse_bool_word(const std::string& s, bool* out) {
  if (s == "true" || s == "True" || s == "TRUE") { *out = true; return true; }
  if (s == "false" || s == "False" || s == "FALSE") { *out = false; return true; }
  return false;
}

bool parse_number_word(const std::string& s, double* out) {
  if (s.empty()) return false;
  const char c0 = s[0];
  if (!(std::isdigit(static_cast<unsigned char>(c0)) || c0 == '-' || c0 == '+' || c0 == '.')) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

Value scalar_value(const YAML::Node& node) {
  const std::string& text = node.Scalar();
  // Quoted scalars carry the "!" tag; only plain ("?") scalars are inferred.
  if (node.Tag() != "?") return Value::string(text);

  if (is_null_word(text)) return Value::null();
  bool b = false;
  if (parse_bool_word(text, &b)) return Value::boolean(b);
  double d = 0.0;
  if (parse_number_word(text, &d)) return Value::number(d);
  return Value::string(text);
}

Value convert(const YAML::Node& node, std::string_view source) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value::null();
    case YAML::NodeType::Scalar:
      return scalar_value(node);
    case YAML::NodeType::Sequence: {
      Value out = Value::list();
      for (const auto& child : node) out.push_back(convert(child, source));
      return out;
    }
    case YAML::NodeType::Map: {
      Value out = Value::map();
      for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->first.IsScalar()) {
          PLUGPLAN_THROW(ErrorCode::kParseError,
                         std::string(source) + ": non-scalar mapping key at line " +
                             std::to_string(it->first.Mark().line + 1));
        }
        out.set(it->first.Scalar(), convert(it->second, source));
      }
      return out;
    }
    default:
      PLUGPLAN_THROW(ErrorCode::kParseError, std::string(source) + ": unsupported YAML node");
  }
}

} // namespace

Value value_from_yaml(const YAML::Node& node, std::string_view source) {
  return convert(node, source);
}

Value parse_yaml_text(std::string_view text, std::string_view source) {
  try {
    const YAML::Node root = YAML::Load(std::string(text));
    return convert(root, source);
  } catch (const YAML::Exception& e) {
    PLUGPLAN_THROW(ErrorCode::kParseError, std::string(source) + ": " + e.what());
  }
}

Value load_yaml_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    PLUGPLAN_THROW(ErrorCode::kIoError, "cannot open " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_yaml_text(buf.str(), path);
}

} // namespace plugplan

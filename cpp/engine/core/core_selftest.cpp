/*
  Fragment 1.9 — Core Selftest

  Framework-free checks for the dynamic value tree, YAML ingestion,
  canonical number text, hashing and settings validation.

  Expected use
  ------------
      ./core_selftest
  Non-zero return code indicates failure.
*/

#include <string>

#include "engine/core/error.hpp"
#include "engine/core/hashing.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/selftest.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/value.hpp"
#include "engine/core/yaml_value.hpp"

namespace plugplan {
namespace {

using namespace selftest;

void test_yaml_scalars() {
  const Value v = parse_yaml_text(
      "a: 12\n"
      "b: \"12\"\n"
      "c: 08A\n"
      "d: true\n"
      "e: ~\n"
      "f: [1, 2]\n"
      "g: {x: 4.5}\n",
      "inline");

  expect_true(v.is_map(), "yaml: root is a map");
  expect_true(v.find("a")->is_number(), "yaml: plain 12 is a number");
  expect_true(v.find("b")->is_string(), "yaml: quoted 12 stays a string");
  expect_eq_str(v.find("c")->as_string(), "08A", "yaml: 08A stays text");
  expect_true(v.find("d")->as_bool(), "yaml: true is a bool");
  expect_true(v.find("e")->is_null(), "yaml: ~ is null");
  expect_eq_int(static_cast<long long>(v.find("f")->size()), 2, "yaml: list size");
  expect_near(v.find_path("g.x")->number_or_none(), 4.5, 1e-12, "yaml: dotted path lookup");

  expect_throws<Error>([] { (void)parse_yaml_text("a: [1, 2", "broken"); }, "yaml: malformed text throws");
  expect_throws<Error>([] { (void)load_yaml_file("/nonexistent/plugplan.yaml"); }, "yaml: missing file throws");
}

void test_lenient_readers() {
  expect_near(Value::string(" 6815 ").number_or_none(), 6815.0, 1e-12, "number_or_none accepts numeric strings");
  expect_true(!Value::string("deep").number_or_none().has_value(), "number_or_none rejects words");
  expect_true(Value::string("yes").bool_or_none().value_or(false), "bool_or_none accepts yes");
  expect_true(!Value::string("").present(), "empty string is not present");
  expect_true(Value::number(0).present(), "zero is present");
}

void test_deep_merge() {
  const Value lower = parse_yaml_text("req: {a: 1, b: 2}\nlist: [1, 2, 3]\n", "lower");
  const Value upper = parse_yaml_text("req: {b: 20, c: 30}\nlist: [9]\n", "upper");
  const Value m = deep_merge(lower, upper);

  expect_near(m.find_path("req.a")->number_or_none(), 1.0, 0.0, "merge keeps lower-only keys");
  expect_near(m.find_path("req.b")->number_or_none(), 20.0, 0.0, "merge: upper wins");
  expect_near(m.find_path("req.c")->number_or_none(), 30.0, 0.0, "merge adds upper-only keys");
  expect_eq_int(static_cast<long long>(m.find("list")->size()), 1, "merge: lists replace");
}

void test_format_number() {
  expect_eq_str(format_number(6738.0), "6738", "format_number: integer");
  expect_eq_str(format_number(0.5), "0.5", "format_number: trailing zeros stripped");
  expect_eq_str(format_number(-0.0), "0", "format_number: negative zero");
  expect_eq_str(format_number(1.0 / 3.0), "0.333333", "format_number: six decimals");
}

void test_hashing() {
  Fnv1a64 a;
  a.update_string("ab");
  a.update_string("c");
  Fnv1a64 b;
  b.update_string("a");
  b.update_string("bc");
  expect_true(a.digest() != b.digest(), "hash: length-delimited strings");

  Fnv1a64 z1;
  z1.update_f64(0.0);
  Fnv1a64 z2;
  z2.update_f64(-0.0);
  expect_true(z1.digest() == z2.digest(), "hash: -0.0 canonicalized");

  expect_eq_int(static_cast<long long>(hash_to_hex(hash_text("plan")).size()), 16, "hash_to_hex: 16 nibbles");
  expect_eq_str(hash_to_hex(hash_text("plan")), hash_to_hex(hash_text("plan")), "hash: deterministic");
}

void test_settings() {
  EngineSettings s;
  bool ok = true;
  try {
    s.validate_or_throw();
  } catch (const Error& e) {
    ok = false;
    std::cerr << "  " << e.what() << "\n";
  }
  expect_true(ok, "settings: defaults validate");

  EngineSettings bad;
  bad.materials.default_annular_excess = 3.5;
  expect_throws<Error>([&] { bad.validate_or_throw(); }, "settings: excess out of range rejected");

  EngineSettings empty_kernel;
  empty_kernel.kernel_version.clear();
  expect_throws<Error>([&] { empty_kernel.validate_or_throw(); }, "settings: empty kernel_version rejected");
}

void test_log_level_parse() {
  expect_true(parse_log_level("warn") == LogLevel::WARN, "log level: warn");
  expect_true(parse_log_level("DEBUG") == LogLevel::DEBUG, "log level: case-insensitive");
  expect_true(!parse_log_level("loud").has_value(), "log level: unknown rejected");
}

}  // namespace
}  // namespace plugplan

int main() {
  using namespace plugplan;
  set_log_level(LogLevel::ERROR);

  test_yaml_scalars();
  test_lenient_readers();
  test_deep_merge();
  test_format_number();
  test_hashing();
  test_settings();
  test_log_level_parse();

  return selftest::exit_code("core_selftest");
}

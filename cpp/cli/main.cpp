/*
================================================================================
Fragment 10.0 — CLI: Main Entry Point (plugplan_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the plugging-plan compiler:
    * district code normalization
    * policy resolution (effective policy JSON)
    * plan compilation (plan JSON + filing-row CSV)
    * policy pack lint

Usage:
  plugplan_cli <command> [options]

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures; every exception maps to an exit code
  - Deterministic output (JSON on stdout, logs on stderr for WARN/ERROR)
================================================================================
*/

#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/exports/plan_json.hpp"
#include "engine/exports/rrc_export_csv.hpp"
#include "engine/plan/facts.hpp"
#include "engine/plan/plan_compiler.hpp"
#include "engine/policy/geo.hpp"
#include "engine/policy/names.hpp"
#include "engine/policy/policy_pack.hpp"
#include "engine/policy/policy_resolver.hpp"

using namespace plugplan;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  STRICT_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

struct Args {
  std::string command;
  std::string positional;
  std::string pack_path;
  std::string centroids_path;
  std::string facts_path;
  std::string settings_path;
  std::optional<std::string> district;
  std::optional<std::string> county;
  std::optional<std::string> field;
  std::optional<bool> merge;
  std::string out_path = "-";
  std::string csv_path;
  bool strict = false;
};

static void print_usage(std::ostream& os) {
  os <<
    "plugplan_cli - W-3A plugging plan compiler\n"
    "\n"
    "Usage:\n"
    "  plugplan_cli <command> [options]\n"
    "\n"
    "Commands:\n"
    "  normalize-district <code>   Print the normalized district code (\"8\" -> 08a)\n"
    "  resolve                     Resolve the effective policy and print it as JSON\n"
    "  plan                        Compile a plugging plan for one well\n"
    "  lint                        Report policy pack findings\n"
    "  help                        Show this help message\n"
    "\n"
    "Options:\n"
    "  --pack <base.yaml>          Policy pack base document (resolve, plan, lint)\n"
    "  --centroids <file.json>     County centroid table (optional)\n"
    "  --district <code>           District (plan: defaults to facts.district)\n"
    "  --county <name>             County   (plan: defaults to facts.county)\n"
    "  --field <name>              Field    (plan: defaults to facts.field)\n"
    "  --facts <file.yaml|json>    Well facts map (plan)\n"
    "  --settings <file.yaml>      Engine settings overrides\n"
    "  --merge 0|1                 Force long-plug merge off/on\n"
    "  --out <path|->              JSON output (default stdout)\n"
    "  --csv <path>                Also write filing rows as CSV (plan)\n"
    "  --strict                    Exit 2 on incomplete policy, error violations or lint findings\n"
    "  --log-level <lvl>           debug|info|warn|error\n"
    "\n"
    "Exit Codes:\n"
    "  0 - Success\n"
    "  1 - Invalid arguments\n"
    "  2 - Strict-mode failure\n"
    "  3 - Computation failed\n"
    "  4 - I/O or parse error\n";
}

static bool parse_bool01(const char* s, bool* out) {
  if (!s || !out) return false;
  if (std::strcmp(s, "1") == 0) { *out = true; return true; }
  if (std::strcmp(s, "0") == 0) { *out = false; return true; }
  return false;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  if (!a) return false;
  if (argc < 2) { a->command = "help"; return true; }
  a->command = argv[1];

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--strict") == 0) { a->strict = true; continue; }

    if (std::strncmp(k, "--", 2) != 0) {
      if (!a->positional.empty()) { if (err) *err = std::string("unexpected argument: ") + k; return false; }
      a->positional = k;
      continue;
    }

    if (!get_next(i, argc, argv, &v)) { if (err) *err = std::string(k) + " requires a value"; return false; }

    if (std::strcmp(k, "--pack") == 0) a->pack_path = v;
    else if (std::strcmp(k, "--centroids") == 0) a->centroids_path = v;
    else if (std::strcmp(k, "--facts") == 0) a->facts_path = v;
    else if (std::strcmp(k, "--settings") == 0) a->settings_path = v;
    else if (std::strcmp(k, "--district") == 0) a->district = v;
    else if (std::strcmp(k, "--county") == 0) a->county = v;
    else if (std::strcmp(k, "--field") == 0) a->field = v;
    else if (std::strcmp(k, "--out") == 0) a->out_path = v;
    else if (std::strcmp(k, "--csv") == 0) a->csv_path = v;
    else if (std::strcmp(k, "--merge") == 0) {
      bool b = false;
      if (!parse_bool01(v, &b)) { if (err) *err = "--merge must be 0 or 1"; return false; }
      a->merge = b;
    } else if (std::strcmp(k, "--log-level") == 0) {
      const auto lvl = parse_log_level(v);
      if (!lvl) { if (err) *err = "--log-level must be debug|info|warn|error"; return false; }
      set_log_level(*lvl);
    } else {
      if (err) *err = std::string("unknown option: ") + k;
      return false;
    }
  }
  return true;
}

static int emit(const std::string& out_path, const std::string& content) {
  if (out_path == "-") {
    std::cout << content;
    return std::cout ? ExitCode::SUCCESS : ExitCode::IO_ERROR;
  }
  if (!exports::write_text_file(out_path, content)) {
    std::cerr << "Error: cannot write " << out_path << "\n";
    return ExitCode::IO_ERROR;
  }
  return ExitCode::SUCCESS;
}

static policy::CentroidTable load_centroids(const Args& a) {
  if (a.centroids_path.empty()) return policy::CentroidTable{};
  return policy::CentroidTable::load_json_file(a.centroids_path);
}

static int cmd_normalize_district(const Args& a) {
  if (a.positional.empty()) {
    std::cerr << "normalize-district requires a district code\n";
    return ExitCode::INVALID_ARGS;
  }
  const auto d = policy::normalize_district(a.positional);
  if (!d) {
    std::cerr << "Unrecognized district code: " << a.positional << "\n";
    return ExitCode::INVALID_ARGS;
  }
  std::cout << *d << "\n";
  return ExitCode::SUCCESS;
}

static int cmd_resolve(const Args& a) {
  if (a.pack_path.empty()) { std::cerr << "resolve requires --pack\n"; return ExitCode::INVALID_ARGS; }

  const policy::PolicyPack pack = policy::load_policy_pack(a.pack_path);
  const policy::CentroidTable centroids = load_centroids(a);
  const policy::EffectivePolicy eff = policy::resolve(pack, centroids, {a.district, a.county, a.field});

  const int rc = emit(a.out_path, exports::effective_policy_to_json(eff));
  if (rc != ExitCode::SUCCESS) return rc;
  if (a.strict && !eff.complete) return ExitCode::STRICT_FAILED;
  return ExitCode::SUCCESS;
}

static std::optional<std::string> from_facts(const std::optional<std::string>& explicit_value,
                                             const plan::WellFacts& facts,
                                             const char* key) {
  if (explicit_value) return explicit_value;
  std::string v = facts.text(key);
  if (v.empty()) return std::nullopt;
  return v;
}

static int cmd_plan(const Args& a) {
  if (a.pack_path.empty()) { std::cerr << "plan requires --pack\n"; return ExitCode::INVALID_ARGS; }
  if (a.facts_path.empty()) { std::cerr << "plan requires --facts\n"; return ExitCode::INVALID_ARGS; }

  const EngineSettings settings =
      a.settings_path.empty() ? EngineSettings{} : load_engine_settings(a.settings_path);
  const policy::PolicyPack pack = policy::load_policy_pack(a.pack_path);
  const policy::CentroidTable centroids = load_centroids(a);
  const plan::WellFacts facts = plan::WellFacts::load_file(a.facts_path);

  policy::ResolveRequest req;
  req.district = from_facts(a.district, facts, "district");
  req.county = from_facts(a.county, facts, "county");
  req.field = from_facts(a.field, facts, "field");
  const policy::EffectivePolicy eff = policy::resolve(pack, centroids, req);

  plan::CompileOptions opt;
  opt.merge = a.merge;
  const plan::Plan p = plan::compile_plan(eff, facts, settings, opt);

  int rc = emit(a.out_path, exports::plan_to_json(p));
  if (rc != ExitCode::SUCCESS) return rc;
  if (!a.csv_path.empty() && !exports::write_rrc_csv_file(p, a.csv_path)) {
    std::cerr << "Error: cannot write " << a.csv_path << "\n";
    return ExitCode::IO_ERROR;
  }

  log(LogLevel::INFO, "plan " + p.fingerprint + ": " + std::to_string(p.steps.size()) + " steps, " +
                          std::to_string(p.violations.size()) + " violations");

  if (a.strict) {
    bool blocking = !p.policy_complete;
    for (const auto& v : p.violations) {
      if (v.severity == plan::Severity::kError || v.severity == plan::Severity::kCritical) blocking = true;
    }
    if (blocking) return ExitCode::STRICT_FAILED;
  }
  return ExitCode::SUCCESS;
}

static int cmd_lint(const Args& a) {
  if (a.pack_path.empty()) { std::cerr << "lint requires --pack\n"; return ExitCode::INVALID_ARGS; }

  const policy::PolicyPack pack = policy::load_policy_pack(a.pack_path);
  const auto findings = policy::lint_policy_pack(pack);

  std::string out;
  for (const auto& f : findings) out += f.where + ": " + f.message + "\n";
  out += std::to_string(findings.size()) + " finding(s) in " + pack.policy_id + " " + pack.version + "\n";

  const int rc = emit(a.out_path, out);
  if (rc != ExitCode::SUCCESS) return rc;
  if (a.strict && !findings.empty()) return ExitCode::STRICT_FAILED;
  return ExitCode::SUCCESS;
}

static int exit_code_for(const Error& e) {
  if (is_input_error(e.code())) return ExitCode::IO_ERROR;
  if (e.code() == ErrorCode::kInvalidArgument) return ExitCode::INVALID_ARGS;
  return ExitCode::COMPUTATION_FAILED;
}

int main(int argc, char** argv) {
  Args a;
  std::string err;
  if (!parse_args(argc, argv, &a, &err)) {
    std::cerr << "Error: " << err << "\n\n";
    print_usage(std::cerr);
    return ExitCode::INVALID_ARGS;
  }

  const std::string& cmd = a.command;
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_usage(std::cout);
    return ExitCode::SUCCESS;
  }

  try {
    if (cmd == "normalize-district") return cmd_normalize_district(a);
    if (cmd == "resolve") return cmd_resolve(a);
    if (cmd == "plan") return cmd_plan(a);
    if (cmd == "lint") return cmd_lint(a);
  } catch (const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return exit_code_for(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'plugplan_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}

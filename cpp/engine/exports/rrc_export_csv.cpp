/*
================================================================================
Fragment 9.2 — Exports: Filing-Row CSV Exporter Implementation
FILE: cpp/engine/exports/rrc_export_csv.cpp
================================================================================
*/

#include "engine/exports/rrc_export_csv.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "engine/core/value.hpp"

namespace plugplan::exports {

namespace {

// Quote if the field contains the delimiter, a quote or a newline.
std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(const std::optional<double>& x) {
  if (!x || !std::isfinite(*x)) return "";
  return format_number(*x);
}

std::string csv_int(const std::optional<int>& x) {
  return x ? std::to_string(*x) : std::string();
}

} // namespace

std::string rrc_csv_header(const CsvExportOptions& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;
  h << "plug_no" << d << "step_id" << d << "type" << d << "mechanical_type" << d << "regulatory_purpose" << d
    << "from_ft" << d << "to_ft" << d << "sacks" << d << "cement_class" << d << "wait_hours" << d
    << "tag_required" << d << "toc_ft" << d << "additional_operations" << d << "remarks";
  return h.str();
}

std::string rrc_row_to_csv(const plan::RrcExportRow& r, const CsvExportOptions& opt) {
  std::ostringstream row;
  const char d = opt.delimiter;

  std::string ops;
  for (size_t i = 0; i < r.additional_operations.size(); ++i) {
    if (i) ops += opt.list_separator;
    ops += r.additional_operations[i];
  }

  row << csv_int(r.plug_no) << d << r.step_id << d << csv_escape(r.type, d) << d
      << csv_escape(r.mechanical_type, d) << d << csv_escape(r.regulatory_purpose, d) << d
      << format_number(r.from_ft) << d << format_number(r.to_ft) << d << csv_int(r.sacks) << d
      << csv_escape(r.cement_class, d) << d << csv_double(r.wait_hours) << d << (r.tag_required ? "true" : "false")
      << d << csv_double(r.toc_ft) << d << csv_escape(ops, d) << d << csv_escape(r.remarks, d);
  return row.str();
}

std::string rrc_export_to_csv(const plan::Plan& p, const CsvExportOptions& opt) {
  std::ostringstream out;
  if (opt.include_header) out << rrc_csv_header(opt) << "\n";
  for (const plan::RrcExportRow& r : p.rrc_export) out << rrc_row_to_csv(r, opt) << "\n";
  return out.str();
}

bool write_rrc_csv_file(const plan::Plan& p, const std::string& file_path, const CsvExportOptions& opt) {
  std::ofstream f(file_path, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return false;
  f << rrc_export_to_csv(p, opt);
  f.close();
  return static_cast<bool>(f);
}

} // namespace plugplan::exports

#pragma once
/*
================================================================================
Fragment 9.2 — Exports: Filing-Row CSV Exporter
FILE: cpp/engine/exports/rrc_export_csv.hpp

Purpose:
  - Export a plan's rrc_export rows to CSV for direct form population.
  - One row per plan step, in step order (deepest first).

Hardening:
  - RFC-4180 quoting for fields containing the delimiter, quotes or newlines.
  - Absent values (sacks, wait hours, TOC) export as an empty field.
  - Stable column ordering.
================================================================================
*/

#include <string>

#include "engine/plan/plan_types.hpp"

namespace plugplan::exports {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  // Joins additional_operations inside one field.
  const char* list_separator = " | ";
};

std::string rrc_csv_header(const CsvExportOptions& opt = CsvExportOptions());

std::string rrc_row_to_csv(const plan::RrcExportRow& r, const CsvExportOptions& opt = CsvExportOptions());

std::string rrc_export_to_csv(const plan::Plan& p, const CsvExportOptions& opt = CsvExportOptions());

// Returns true on success, false on I/O error.
bool write_rrc_csv_file(const plan::Plan& p,
                        const std::string& file_path,
                        const CsvExportOptions& opt = CsvExportOptions());

} // namespace plugplan::exports

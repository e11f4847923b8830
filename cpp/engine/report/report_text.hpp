#pragma once
/*
================================================================================
Fragment 6.3 — Report: Text Renderings
FILE: cpp/engine/report/report_text.hpp

  - TSV: one row per Finding, fixed column order, tabs / newlines in cells
    replaced by spaces.
  - Markdown: header table, executive summary, critical failures (failed
    violations), findings grouped by rule category, warnings, rule load errors.
  - Terminal: compact human summary for the CLI.

All renderers are pure functions of the report (byte-identical on repeat).
================================================================================
*/

#include <iosfwd>
#include <string>

#include "engine/core/settings.hpp"
#include "engine/report/compliance_report.hpp"

namespace rascheck::report {

std::string report_to_tsv(const ComplianceReport& report, const ReportSettings& opt = {});

std::string report_to_markdown(const ComplianceReport& report, const ReportSettings& opt = {});

void print_terminal_summary(std::ostream& os, const ComplianceReport& report);

// Display category from a rule id segment: "FEMA-MANN-001" -> "Manning's n".
std::string rule_category(const std::string& rule_id);

} // namespace rascheck::report

#pragma once

#include <iosfwd>
#include <string>

#include "engine/core/settings.hpp"
#include "engine/report/compliance_report.hpp"

namespace rascheck::report {

// Serialize a ComplianceReport to JSON (stable key order, deterministic output).
std::string report_to_json(const ComplianceReport& report, const ReportSettings& opt = {});

// Stream version (avoids extra copy).
void write_report_json(std::ostream& os, const ComplianceReport& report, const ReportSettings& opt = {});

} // namespace rascheck::report

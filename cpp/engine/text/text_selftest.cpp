/*
  Text section parser / writer selftest

  Covers:
    1) Canonical write followed by re-parse yields equal records.
    2) Malformed numeric tokens become NaN with a warning naming the line;
       strict mode raises ParseError instead.
    3) Unterminated BEGIN sections are kept (opaque, truncated) with a warning.
    4) Unknown keywords survive as text fields.
    5) Layout selection follows the "Program Version=" marker.
    6) Fixed-width rows whose values touch are split by column.
    7) File kind detection (suffix, then content for flow files).

  Framework-free; non-zero exit on failure.
*/

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/settings.hpp"
#include "engine/core/source.hpp"
#include "engine/text/section_parser.hpp"
#include "engine/text/section_writer.hpp"

namespace rascheck {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool has_warning_containing(const text::ParsedTextFile& f, std::string_view needle) {
  for (const auto& w : f.all_warnings()) {
    if (w.find(needle) != std::string::npos) return true;
  }
  return false;
}

const char* kGeometry =
    "Geom Title=Test Geometry\n"
    "Program Version=6.30\n"
    "Viewing Rectangle= 0 , 1 , 2 , 3 \n"
    "\n"
    "River Reach=Bald Eagle      ,Loc Hav         \n"
    "Reach XY= 2 \n"
    "       0       0     100     100\n"
    "Rch Text X Y=50,50\n"
    "Reverse River Text= 0 \n"
    "\n"
    "Type RM Length L Ch R = 1 ,5000    ,100,110,120\n"
    "BEGIN DESCRIPTION:\n"
    "Upstream section\n"
    "END DESCRIPTION:\n"
    "#Sta/Elev= 3 \n"
    "       0     100      50      90     100     100\n"
    "#Mann= 3 , 0 , 0 \n"
    "    .035       0       0     .03      30       0    .035      70       0\n"
    "Bank Sta=30,70\n"
    "Exp/Cntr=0.3,0.1\n";

SourceRef geometry_source() {
  return make_source("model.g01");
}

void test_round_trip() {
  const auto parsed = text::parse_text(kGeometry, geometry_source());
  expect_eq_str(parsed.layout_name, "geometry", "Version 6.30 selects the current geometry layout");
  expect_true(parsed.records.size() == 3, "Geometry parses to root + reach + node");
  expect_true(parsed.all_warnings().empty(), "Clean geometry has no warnings");

  const auto& node = parsed.records[2];
  expect_eq_str(node.section, "node", "Third record is a node");
  const auto* opener = node.find("Type RM Length L Ch R");
  expect_true(opener && opener->value.as_strings().size() == 5, "Node opener keeps 5 values");
  expect_true(opener && opener->value.as_strings()[1] == "5000", "Node station trimmed");

  const auto* mann = node.find("#Mann");
  expect_true(mann && mann->value.as_numbers().size() == 9, "#Mann has 3 entries x 3 values");
  expect_true(mann && std::fabs(mann->value.as_numbers()[0] - 0.035) < 1e-12, "#Mann left n leads its entry");
  expect_true(mann && mann->header == "3 , 0 , 0", "#Mann header kept");

  const auto* desc = node.find("DESCRIPTION");
  expect_true(desc && desc->value.as_string() == "Upstream section", "Node text block captured");

  const std::string written = text::write_text(parsed);
  const auto reparsed = text::parse_text(written, geometry_source());
  expect_true(reparsed.records == parsed.records, "parse(write(parse(x))) == parse(x)");

  const std::string written2 = text::write_text(reparsed);
  expect_eq_str(written, written2, "Canonical writer output is stable");
}

// Cells that fill all 8 columns only fit without their leading zero.
void test_round_trip_full_width_cells() {
  std::string g = kGeometry;
  const std::string sta = "#Sta/Elev= 3 \n       0     100      50      90     100     100\n";
  g.replace(g.find(sta), sta.size(), "#Sta/Elev= 2 \n-.123456 12345.61.234567     100\n");

  const auto parsed = text::parse_text(g, geometry_source());
  const auto* se = parsed.records[2].find("#Sta/Elev");
  expect_true(se && se->value.as_numbers().size() == 4, "Full-width #Sta/Elev has 4 values");
  expect_true(se && se->value.as_numbers()[0] == -0.123456, "Leading-dot negative cell parsed");
  expect_true(se && se->value.as_numbers()[2] == 1.234567, "Touching cell parsed");

  const std::string written = text::write_text(parsed);
  expect_true(written.find("-.123456") != std::string::npos, "Writer drops the leading zero to keep precision");
  const auto reparsed = text::parse_text(written, geometry_source());
  const auto* se2 = reparsed.records[2].find("#Sta/Elev");
  expect_true(se && se2 && se2->value.as_numbers() == se->value.as_numbers(), "Full-width cells survive a round trip");
  expect_true(reparsed.records == parsed.records, "Full-width geometry: parse(write(parse(x))) == parse(x)");
}

void test_malformed_manning() {
  std::string g = kGeometry;
  const std::string good = "     .03";
  g.replace(g.find(good), good.size(), "     abc");

  const auto parsed = text::parse_text(g, geometry_source());
  const auto* mann = parsed.records[2].find("#Mann");
  expect_true(mann && mann->value.as_numbers().size() == 9, "Malformed #Mann keeps its size");
  expect_true(mann && std::isnan(mann->value.as_numbers()[3]), "Malformed n becomes NaN");
  expect_true(has_warning_containing(parsed, "line 18"), "Warning names the offending line");
  expect_true(has_warning_containing(parsed, "abc"), "Warning names the offending token");

  ParseSettings strict;
  strict.strict = true;
  bool threw = false;
  try {
    (void)text::parse_text(g, geometry_source(), strict);
  } catch (const ParseError& e) {
    threw = e.line() == 18;
  }
  expect_true(threw, "Strict mode raises ParseError at line 18");
}

void test_truncated_section() {
  const std::string g = std::string(kGeometry) + "BEGIN FUTURE DATA:\n  1 2 3\n";
  const auto parsed = text::parse_text(g, geometry_source());
  expect_true(parsed.truncated, "File flagged truncated");
  const auto& last = parsed.records.back();
  expect_true(last.opaque && last.truncated, "Unterminated unknown section kept opaque + truncated");
  expect_eq_str(last.section, "FUTURE DATA", "Opaque record keeps the section name");
  expect_true(last.fields.size() == 1 && last.fields[0].raw, "Opaque body kept verbatim");
  expect_true(has_warning_containing(parsed, "truncated"), "Truncation reported as warning");

  const auto reparsed = text::parse_text(text::write_text(parsed), geometry_source());
  expect_true(!reparsed.truncated, "Written opaque section is terminated");

  ParseSettings strict;
  strict.strict = true;
  bool threw = false;
  try {
    (void)text::parse_text(g, geometry_source(), strict);
  } catch (const ParseError&) {
    threw = true;
  }
  expect_true(threw, "Strict mode rejects unterminated sections");
}

void test_unknown_keyword() {
  const std::string g = std::string(kGeometry) + "Mystery Key=42\n";
  const auto parsed = text::parse_text(g, geometry_source());
  const auto* f = parsed.records.back().find("Mystery Key");
  expect_true(f && f->value.as_string() == "42", "Unknown keyword kept as text");
  expect_true(has_warning_containing(parsed, "unknown keyword 'Mystery Key'"), "Unknown keyword warned");

  ParseSettings strict;
  strict.strict = true;
  bool threw = false;
  try {
    (void)text::parse_text(g, geometry_source(), strict);
  } catch (const ParseError& e) {
    threw = e.reason().find("Mystery Key") != std::string::npos;
  }
  expect_true(threw, "Strict mode rejects unknown keywords");
}

void test_version_selection() {
  std::string legacy = kGeometry;
  legacy.replace(legacy.find("6.30"), 4, "4.10");
  expect_eq_str(text::parse_text(legacy, geometry_source()).layout_name, "geometry_legacy",
                "Version 4.10 selects the legacy layout");

  std::string none = kGeometry;
  none.erase(none.find("Program Version=6.30\n"), 21);
  const auto parsed = text::parse_text(none, geometry_source());
  expect_eq_str(parsed.layout_name, "geometry", "No marker falls back to the newest layout");
  expect_true(has_warning_containing(parsed, "Program Version"), "Missing marker warned");
}

void test_incomplete_table() {
  const char* g =
      "Program Version=6.30\n"
      "Type RM Length L Ch R = 1 ,100,0,0,0\n"
      "#Sta/Elev= 3 \n"
      "       0     100      50      90\n"
      "Bank Sta=0,50\n";
  const auto parsed = text::parse_text(g, geometry_source());
  const auto* se = parsed.records[1].find("#Sta/Elev");
  expect_true(se && se->value.as_numbers().size() == 4, "Short table keeps what was read");
  expect_true(has_warning_containing(parsed, "expected 6 values, found 4"), "Short table warned");
  expect_true(parsed.records[1].find("Bank Sta") != nullptr, "Parsing continues after short table");
}

const char* kSteady =
    "Flow Title=Flows\n"
    "Program Version=6.30\n"
    "Number of Profiles= 3 \n"
    "Profile Names=10yr,100yr,500yr\n"
    "River Rch & RM=Bald Eagle,Loc Hav ,5000\n"
    "    100012345.6712345.67\n"
    "Boundary for River Rch & Prof#=Bald Eagle,Loc Hav , 1 \n"
    "Up Type= 0 \n"
    "Dn Type= 3 \n"
    "Dn Slope=0.001\n";

void test_fixed_width_flows() {
  const auto parsed = text::parse_text(kSteady, make_source("model.f01"));
  expect_true(parsed.records.size() == 3, "Steady flow parses to root + change + boundary");
  const auto* flows = parsed.records[1].find("Flows");
  expect_true(flows && flows->value.as_numbers().size() == 3, "Trailing flows counted by profiles");
  expect_true(flows && flows->value.as_numbers()[0] == 1000.0, "Touching column 1");
  expect_true(flows && std::fabs(flows->value.as_numbers()[2] - 12345.67) < 1e-9, "Touching column 3");

  const auto* names = parsed.root().find("Profile Names");
  expect_true(names && names->value.as_strings().size() == 3, "Profile names list");

  const auto* dn = parsed.records[2].find("Dn Slope");
  expect_true(dn && dn->value.as_number() == 0.001, "Boundary slope");

  const auto reparsed = text::parse_text(text::write_text(parsed), make_source("model.f01"));
  expect_true(reparsed.records == parsed.records, "Steady flow round trip");
}

void test_file_kinds() {
  expect_true(detect_file_kind("a/b/Model.G01") == FileKind::kGeometry, "Geometry suffix");
  expect_true(detect_file_kind("m.prj") == FileKind::kProject, "Project suffix");
  expect_true(detect_file_kind("m.p03") == FileKind::kPlan, "Plan suffix");
  expect_true(detect_file_kind("m.txt") == FileKind::kUnknown, "Unknown suffix");

  const SourceRef r = make_source("m.p01.hdf");
  expect_true(r.kind == FileKind::kResult && r.id == "p01", "Result id from inner suffix");

  expect_true(refine_flow_kind(FileKind::kUnsteadyFlow, kSteady) == FileKind::kSteadyFlow,
              "Content identifies steady flow");
  expect_true(refine_flow_kind(FileKind::kSteadyFlow, "Boundary Location=a,b,1\n") ==
                  FileKind::kUnsteadyFlow,
              "Content identifies unsteady flow");
  expect_true(refine_flow_kind(FileKind::kGeometry, kSteady) == FileKind::kGeometry,
              "Non-flow kinds are not refined");
}

void test_file_errors() {
  const auto dir = std::filesystem::temp_directory_path() /
                   ("rascheck_text_selftest_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);

  const Settings settings = Settings::defaults();

  bool io = false;
  try {
    (void)text::parse_text_file((dir / "missing.g01").string(), settings);
  } catch (const IoError&) {
    io = true;
  }
  expect_true(io, "Missing file raises IoError");

  const std::string bin = (dir / "binary.g01").string();
  write_text_file(bin, std::string("Geom Title=x\n\0\0\0", 16));
  bool parse = false;
  try {
    (void)text::parse_text_file(bin, settings);
  } catch (const ParseError&) {
    parse = true;
  }
  expect_true(parse, "Binary content raises ParseError");

  const std::string good = (dir / "model.g01").string();
  write_text_file(good, kGeometry);
  const auto parsed = text::parse_text_file(good, settings);
  expect_true(parsed.source.id == "g01" && parsed.records.size() == 3, "File parse");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;

  test_round_trip();
  test_round_trip_full_width_cells();
  test_malformed_manning();
  test_truncated_section();
  test_unknown_keyword();
  test_version_selection();
  test_incomplete_table();
  test_fixed_width_flows();
  test_file_kinds();
  test_file_errors();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}

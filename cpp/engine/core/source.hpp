#pragma once

#include <string>
#include <string_view>

namespace rascheck {

// Input file kinds, in canonical merge order (the numeric value is the
// primary sort key when sources are canonicalized).
enum class FileKind : int {
  kProject = 0,       // .prj
  kGeometry = 1,      // .g01 .. .g99
  kPlan = 2,          // .p01 .. .p99
  kSteadyFlow = 3,    // .f01 .. .f99
  kUnsteadyFlow = 4,  // .u01 .. .u99
  kQuasiFlow = 5,     // .q01 .. .q99
  kResult = 6,        // .p01.hdf (HDF5 result container)
  kUnknown = 99,
};

const char* file_kind_name(FileKind k) noexcept;

bool is_text_kind(FileKind k) noexcept;
bool is_flow_kind(FileKind k) noexcept;

// Identity of one input file as it appears in warnings, provenance and the
// report metadata.
struct SourceRef {
  std::string path;
  FileKind kind = FileKind::kUnknown;
  std::string id;  // conventional short id: "prj", "g01", "p02", "f01", "p01" (result)

  std::string label() const { return id.empty() ? path : path + " [" + id + "]"; }
};

// Canonical order: kind, then id, then path.
bool source_less(const SourceRef& a, const SourceRef& b) noexcept;

// Kind from the conventional path suffix (case-insensitive).
FileKind detect_file_kind(std::string_view path) noexcept;

// Flow files are also recognized by content: "Boundary Location=" means
// unsteady, "Number of Profiles=" means steady. Non-flow kinds pass through.
FileKind refine_flow_kind(FileKind suffix_kind, std::string_view content) noexcept;

// SourceRef for a path with its detected kind and short id.
SourceRef make_source(const std::string& path);

} // namespace rascheck

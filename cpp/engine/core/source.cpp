#include "engine/core/source.hpp"

#include <cctype>
#include <filesystem>

#include "engine/core/strings.hpp"

namespace rascheck {
namespace {

// ".g01" style: dot, letter, two digits.
bool is_numbered_ext(std::string_view ext, char letter) {
  return ext.size() == 4 && ext[0] == '.' && ext[1] == letter &&
         std::isdigit(static_cast<unsigned char>(ext[2])) &&
         std::isdigit(static_cast<unsigned char>(ext[3]));
}

} // namespace

const char* file_kind_name(FileKind k) noexcept {
  switch (k) {
    case FileKind::kProject:      return "project";
    case FileKind::kGeometry:     return "geometry";
    case FileKind::kPlan:         return "plan";
    case FileKind::kSteadyFlow:   return "steady_flow";
    case FileKind::kUnsteadyFlow: return "unsteady_flow";
    case FileKind::kQuasiFlow:    return "quasi_flow";
    case FileKind::kResult:       return "result";
    default:                      return "unknown";
  }
}

bool is_text_kind(FileKind k) noexcept {
  return k == FileKind::kProject || k == FileKind::kGeometry || k == FileKind::kPlan ||
         is_flow_kind(k);
}

bool is_flow_kind(FileKind k) noexcept {
  return k == FileKind::kSteadyFlow || k == FileKind::kUnsteadyFlow || k == FileKind::kQuasiFlow;
}

bool source_less(const SourceRef& a, const SourceRef& b) noexcept {
  if (a.kind != b.kind) return static_cast<int>(a.kind) < static_cast<int>(b.kind);
  if (a.id != b.id) return natural_less(a.id, b.id);
  return a.path < b.path;
}

FileKind detect_file_kind(std::string_view path) noexcept {
  try {
    const std::filesystem::path p{std::string(path)};
    const std::string ext = to_lower(p.extension().string());
    if (ext == ".prj") return FileKind::kProject;
    if (ext == ".hdf" || ext == ".h5") return FileKind::kResult;
    if (is_numbered_ext(ext, 'g')) return FileKind::kGeometry;
    if (is_numbered_ext(ext, 'p')) return FileKind::kPlan;
    if (is_numbered_ext(ext, 'f')) return FileKind::kSteadyFlow;
    if (is_numbered_ext(ext, 'u')) return FileKind::kUnsteadyFlow;
    if (is_numbered_ext(ext, 'q')) return FileKind::kQuasiFlow;
  } catch (const std::exception&) {
    // Unrepresentable path: treat as unknown.
  }
  return FileKind::kUnknown;
}

FileKind refine_flow_kind(FileKind suffix_kind, std::string_view content) noexcept {
  if (!is_flow_kind(suffix_kind)) return suffix_kind;
  if (content.find("Boundary Location=") != std::string_view::npos) {
    return suffix_kind == FileKind::kQuasiFlow ? FileKind::kQuasiFlow : FileKind::kUnsteadyFlow;
  }
  if (content.find("Number of Profiles=") != std::string_view::npos) return FileKind::kSteadyFlow;
  return suffix_kind;
}

SourceRef make_source(const std::string& path) {
  SourceRef s;
  s.path = path;
  s.kind = detect_file_kind(path);
  const std::filesystem::path p{path};
  std::string ext = to_lower(p.extension().string());
  if (s.kind == FileKind::kResult) {
    // "model.p01.hdf" -> "p01"
    ext = to_lower(p.stem().extension().string());
  }
  if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
  s.id = ext;
  return s;
}

} // namespace rascheck

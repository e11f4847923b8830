#include "engine/pipeline/input_resolver.hpp"

#include <filesystem>
#include <initializer_list>
#include <set>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/source.hpp"
#include "engine/core/strings.hpp"
#include "engine/text/section_parser.hpp"

namespace rascheck::pipeline {
namespace {

namespace fs = std::filesystem;

std::vector<std::string> listed(const text::RawRecord& root, std::string_view field) {
  std::vector<std::string> out;
  for (const auto& f : root.fields) {
    if (f.name != field || f.value.is_missing()) continue;
    std::string v = to_lower(trim(f.value.as_string()));
    if (!v.empty()) out.push_back(std::move(v));
  }
  return out;
}

class Resolver {
 public:
  explicit Resolver(const Settings& settings) : settings_(settings) {}

  void add(const std::string& path) {
    const FileKind kind = detect_file_kind(path);
    if (kind == FileKind::kProject) {
      add_project(path);
    } else if (kind == FileKind::kResult) {
      add_result(path);
    } else {
      add_text(path);
    }
  }

  ResolvedInputs take() { return std::move(out_); }

 private:
  bool claim(const std::string& path) {
    return seen_.insert(fs::path(path).lexically_normal().string()).second;
  }

  void warn(std::string msg) {
    log_warn("resolve: " + msg);
    out_.warnings.push_back(std::move(msg));
  }

  void add_text(const std::string& path) {
    if (claim(path)) out_.text_paths.push_back(path);
  }

  void add_result(const std::string& path) {
    if (claim(path)) out_.result_paths.push_back(path);
  }

  // Parses a file now so resolution can read it; nullptr on failure.
  const text::ParsedTextFile* parse_now(const std::string& path) {
    if (!claim(path)) return nullptr;
    try {
      out_.parsed.push_back(text::parse_text_file(path, settings_));
      return &out_.parsed.back();
    } catch (const RascheckError& e) {
      warn(std::string(e.what()) + "; file skipped");
      return nullptr;
    }
  }

  void add_project(const std::string& path) {
    const text::ParsedTextFile* prj = parse_now(path);
    if (!prj) return;

    const fs::path dir = fs::path(path).parent_path();
    const std::string stem = fs::path(path).stem().string();
    const auto sibling = [&dir, &stem](const std::string& ext) { return (dir / (stem + "." + ext)).string(); };

    const text::RawRecord root = prj->root();  // copy: out_.parsed may grow below
    const auto want = [&](const std::string& ext, bool result) {
      const std::string p = sibling(ext);
      if (!file_exists(p)) {
        if (!result) warn(path + " lists " + stem + "." + ext + " but the file does not exist");
        return;
      }
      if (result) add_result(p);
      else add_text(p);
    };

    std::string plan;
    if (const text::Field* cp = root.find("Current Plan"); cp && !cp->value.is_missing()) {
      plan = to_lower(trim(cp->value.as_string()));
      if (!plan.empty() && !file_exists(sibling(plan))) {
        warn(path + ": current plan " + plan + " does not exist; using every listed file");
        plan.clear();
      }
    }

    if (!plan.empty()) {
      if (const text::ParsedTextFile* pf = parse_now(sibling(plan))) {
        const text::RawRecord proot = pf->root();
        for (const char* link : {"Geom File", "Flow File"}) {
          for (const auto& ext : listed(proot, link)) want(ext, false);
        }
        if (file_exists(sibling(plan + ".hdf"))) want(plan + ".hdf", true);
        log_debug("resolve: " + path + ": current plan " + plan);
        return;
      }
    }

    for (const char* field : {"Geom File", "Plan File", "Steady File", "Unsteady File", "QuasiSteady File"}) {
      for (const auto& ext : listed(root, field)) want(ext, false);
    }
    for (const auto& p : listed(root, "Plan File")) {
      if (file_exists(sibling(p + ".hdf"))) want(p + ".hdf", true);
    }
  }

  const Settings& settings_;
  ResolvedInputs out_;
  std::set<std::string> seen_;
};

} // namespace

ResolvedInputs resolve_inputs(const std::vector<std::string>& paths, const Settings& settings) {
  Resolver r(settings);
  for (const auto& p : paths) r.add(p);
  ResolvedInputs out = r.take();
  log_debug("resolve: " + std::to_string(out.parsed.size() + out.text_paths.size()) + " text file(s), " +
            std::to_string(out.result_paths.size()) + " result file(s)");
  return out;
}

} // namespace rascheck::pipeline

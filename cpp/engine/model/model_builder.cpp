#include "engine/model/model_builder.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <variant>

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"
#include "engine/results/result_layout.hpp"

namespace rascheck::model {

std::string canonical_station(std::string_view rs) {
  const std::string t = trim(rs);
  if (const auto d = try_parse_double(t)) return format_number(*d);
  return t;
}

std::string reach_id(std::string_view river, std::string_view reach) {
  return trim(river) + "/" + trim(reach);
}

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Relation target type of plan -> geometry file links (not an entity type).
constexpr const char* kGeometryLink = "geometry";

// Unsteady boundary tables, in the order they decide the boundary type.
const std::pair<const char*, const char*> kHydrographTables[] = {
    {"Flow Hydrograph", "flow_hydrograph"},
    {"Stage Hydrograph", "stage_hydrograph"},
    {"Lateral Inflow Hydrograph", "lateral_inflow_hydrograph"},
    {"Uniform Lateral Inflow Hydrograph", "uniform_lateral_inflow"},
    {"Gate Openings", "gate_openings"},
    {"Rating Curve", "rating_curve"},
    {"Precipitation Hydrograph", "precipitation_hydrograph"},
};

const char* steady_boundary_name(double code) noexcept {
  switch (static_cast<int>(code)) {
    case 1: return "known_ws";
    case 2: return "critical_depth";
    case 3: return "normal_depth";
    case 4: return "rating_curve";
    default: return "none";
  }
}

std::string flow_regime_name(const std::string& bare) {
  const std::string l = to_lower(bare);
  if (l.rfind("subcritical", 0) == 0) return "subcritical";
  if (l.rfind("supercritical", 0) == 0) return "supercritical";
  return "mixed";
}

std::optional<double> max_finite(const std::vector<double>& v) {
  std::optional<double> out;
  for (const double x : v) {
    if (std::isfinite(x) && (!out || x > *out)) out = x;
  }
  return out;
}

std::optional<double> min_finite(const std::vector<double>& v) {
  std::optional<double> out;
  for (const double x : v) {
    if (std::isfinite(x) && (!out || x < *out)) out = x;
  }
  return out;
}

// Pier width at `z` from (elevation, width) pairs in file order; clamped to
// the first / last pair outside the table.
double pier_width_at(const std::vector<double>& t, double z) {
  std::vector<std::pair<double, double>> pts;
  for (std::size_t k = 0; k + 1 < t.size(); k += 2) {
    if (std::isfinite(t[k]) && std::isfinite(t[k + 1])) pts.emplace_back(t[k], t[k + 1]);
  }
  if (pts.empty()) return 0.0;
  if (z <= pts.front().first) return pts.front().second;
  if (z >= pts.back().first) return pts.back().second;
  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    const auto& lo = pts[i];
    const auto& hi = pts[i + 1];
    if (lo.first <= z && z <= hi.first) {
      if (hi.first == lo.first) return hi.second;
      const double frac = (z - lo.first) / (hi.first - lo.first);
      return lo.second + frac * (hi.second - lo.second);
    }
  }
  return pts.back().second;
}

struct Pier {
  double center_upstream = kNaN;
  std::vector<double> elev_width;  // first "#Pier Elev" table of the pier
  bool has_table = false;
};

// Where a design value came from.
struct Site {
  const text::ParsedTextFile* file = nullptr;
  int line = 0;

  std::string label() const {
    return line > 0 ? file->source.path + ":" + std::to_string(line) : file->source.path;
  }
};

} // namespace

namespace detail {

class ModelAssembly {
 public:
  ModelAssembly(const MergeSettings& settings, const IMergePolicy& policy, HydraulicModel& model)
      : settings_(settings), policy_(policy), model_(model) {}

  void select_active_plan(const std::vector<text::ParsedTextFile>& files) {
    std::string current;
    for (const auto& f : files) {
      if (f.source.kind != FileKind::kProject) continue;
      if (const text::Field* cp = f.root().find("Current Plan")) {
        current = to_lower(trim(cp->value.as_string()));
        if (!current.empty()) break;
      }
    }

    std::vector<const text::ParsedTextFile*> plans;
    for (const auto& f : files) {
      if (f.source.kind == FileKind::kPlan) plans.push_back(&f);
    }

    const text::ParsedTextFile* active = nullptr;
    for (const auto* p : plans) {
      if (!current.empty() && to_lower(p->source.id) == current) active = p;
    }
    if (!active && plans.size() == 1) active = plans.front();
    if (!active) {
      if (!current.empty()) log_debug("current plan '" + current + "' not among the inputs");
      return;
    }

    active_plan_ = active->source.id;
    for (const char* link : {"Geom File", "Flow File"}) {
      if (const text::Field* fl = active->root().find(link)) {
        const std::string id = to_lower(trim(fl->value.as_string()));
        if (!id.empty()) active_links_.insert(id);
      }
    }
  }

  void add_text(const text::ParsedTextFile& f) {
    switch (f.source.kind) {
      case FileKind::kProject: add_project(f); break;
      case FileKind::kPlan: add_plan(f); break;
      case FileKind::kGeometry: add_geometry(f); break;
      case FileKind::kSteadyFlow: add_steady_flow(f); break;
      case FileKind::kUnsteadyFlow:
      case FileKind::kQuasiFlow: add_unsteady_flow(f); break;
      default:
        warn(f.source.path + ": file kind '" + file_kind_name(f.source.kind) +
             "' carries no model data; skipped");
        break;
    }
  }

  void add_result(const results::ParsedResultFile& f);
  void derive();

  void record_sources(const std::vector<text::ParsedTextFile>& text_files,
                      const std::vector<results::ParsedResultFile>& result_files) {
    for (const auto& f : text_files) model_.sources_.push_back(f.source);
    for (const auto& f : result_files) model_.sources_.push_back(f.source);
  }

  const std::string& active_plan() const noexcept { return active_plan_; }

 private:
  // ---------------------------------------------------------------- writing
  void warn(std::string msg) {
    log_warn(msg);
    model_.warnings_.push_back(std::move(msg));
  }

  void put(Entity& e, const std::string& name, Value v, const Site& at) {
    Attribute a;
    a.value = std::move(v);
    a.origin = Origin::kDesign;
    a.source = at.label();
    a.source_id = at.file->source.id;

    const Attribute* prev = e.attribute(name);
    if (!prev) {
      e.set(name, std::move(a));
      return;
    }
    if (values_equivalent(prev->value, a.value, settings_.numeric_rel_tol)) return;

    const std::string what = e.key().to_string() + " attribute '" + name + "'";
    const std::string& path = at.file->source.path;
    if (prev->source == path || prev->source.rfind(path + ":", 0) == 0) {
      warn(what + ": " + a.source + " redefines " + prev->value.to_display() + " as " +
           a.value.to_display() + "; later value kept");
      e.set(name, std::move(a));
      return;
    }

    const bool prev_linked = active_links_.count(to_lower(prev->source_id)) > 0;
    const bool new_linked = active_links_.count(to_lower(a.source_id)) > 0;
    if (prev_linked != new_linked) {
      const Attribute& win = new_linked ? a : *prev;
      const Attribute& lose = new_linked ? *prev : a;
      warn(what + ": " + win.source + " (" + win.value.to_display() + ") overrides " +
           lose.source + " (" + lose.value.to_display() + "); active plan " + active_plan_ +
           " links " + win.source_id);
      if (new_linked) e.set(name, std::move(a));
      return;
    }

    throw ModelConsistencyError(
        "conflicting design values for " + what + ": " + prev->source + " = " +
            prev->value.to_display() + ", " + a.source + " = " + a.value.to_display() +
            (active_plan_.empty() ? std::string("; no active plan")
                                  : "; active plan " + active_plan_ + " links neither or both"),
        prev->source, a.source);
  }

  void put_result(Entity& e, const std::string& name, Value v, const std::string& source,
                  const std::string& source_id) {
    Attribute r;
    r.value = std::move(v);
    r.origin = Origin::kResult;
    r.source = source;
    r.source_id = source_id;

    const Attribute* prev = e.attribute(name);
    if (!prev) {
      e.set(name, std::move(r));
      return;
    }
    if (prev->origin == Origin::kResult && prev->source_id != source_id) {
      warn(e.key().to_string() + " attribute '" + name + "': " + source +
           " overrides earlier result " + prev->source);
    }
    if (prev->origin == Origin::kResult && !prev->design_value) {
      e.set(name, std::move(r));
      return;
    }
    // prev carries (or is) the text value.
    Attribute design = *prev;
    if (design.design_value) {
      design.value = *design.design_value;
      design.origin = Origin::kDesign;
      design.design_value.reset();
    }
    e.set(name, policy_.merge(design, r));
  }

  void put_derived(Entity& e, const std::string& name, Value v, Origin origin) {
    Attribute a;
    a.value = std::move(v);
    a.origin = origin;
    a.source = "derived";
    e.set(name, std::move(a));
  }

  // --------------------------------------------------------- field helpers
  static const text::Field* present(const text::RawRecord& rec, std::string_view field) {
    const text::Field* f = rec.find(field);
    return (f && !f->value.is_missing()) ? f : nullptr;
  }

  void put_string(Entity& e, const std::string& attr, const text::RawRecord& rec,
                  std::string_view field, const text::ParsedTextFile& file) {
    if (const text::Field* f = present(rec, field)) {
      std::string s = trim(f->value.as_string());
      if (!s.empty()) put(e, attr, Value::string(std::move(s)), Site{&file, f->line});
    }
  }

  void put_number(Entity& e, const std::string& attr, const text::RawRecord& rec,
                  std::string_view field, const text::ParsedTextFile& file) {
    if (const text::Field* f = present(rec, field)) {
      put(e, attr, Value::number(f->value.as_number()), Site{&file, f->line});
    }
  }

  void put_flag(Entity& e, const std::string& attr, const text::RawRecord& rec,
                std::string_view field, const text::ParsedTextFile& file) {
    if (const text::Field* f = present(rec, field)) {
      put(e, attr, Value::boolean(f->value.as_number() != 0.0), Site{&file, f->line});
    }
  }

  void put_numbers(Entity& e, const std::string& attr, const text::RawRecord& rec,
                   std::string_view field, const text::ParsedTextFile& file) {
    if (const text::Field* f = present(rec, field)) {
      put(e, attr, Value::numbers(f->value.as_numbers()), Site{&file, f->line});
    }
  }

  void put_station(Entity& e, const std::string& rs, const Site& at) {
    const std::string st = canonical_station(rs);
    put(e, "station_id", Value::string(st), at);
    if (const auto d = try_parse_double(st)) put(e, "station", Value::number(*d), at);
  }

  // ----------------------------------------------------------------- kinds
  void add_project(const text::ParsedTextFile& f) {
    const std::string id = std::filesystem::path(f.source.path).stem().string();
    Entity& e = model_.upsert(kProject, id);
    const text::RawRecord& root = f.root();

    put_string(e, "title", root, "Proj Title", f);
    if (const text::Field* cp = present(root, "Current Plan")) {
      const std::string v = to_lower(trim(cp->value.as_string()));
      if (!v.empty()) put(e, "current_plan", Value::string(v), Site{&f, cp->line});
    }
    if (const text::Field* u = present(root, "Units")) {
      const std::string v = to_lower(u->value.as_string()).rfind("english", 0) == 0 ? "english" : "si";
      put(e, "units", Value::string(v), Site{&f, u->line});
    }
    if (const text::Field* d = present(root, "Default Exp/Contr")) {
      const auto& v = d->value.as_numbers();
      if (!v.empty() && std::isfinite(v[0])) put(e, "default_expansion", Value::number(v[0]), Site{&f, d->line});
      if (v.size() > 1 && std::isfinite(v[1])) put(e, "default_contraction", Value::number(v[1]), Site{&f, d->line});
    }

    const std::pair<const char*, const char*> lists[] = {
        {"Geom File", "geom_files"},       {"Plan File", "plan_files"},
        {"Steady File", "steady_files"},   {"Unsteady File", "unsteady_files"},
        {"QuasiSteady File", "quasi_files"},
    };
    for (const auto& [field, attr] : lists) {
      std::vector<std::string> ids;
      int line = 0;
      for (const auto& fl : root.fields) {
        if (fl.name != field || fl.value.is_missing()) continue;
        std::string v = to_lower(trim(fl.value.as_string()));
        if (v.empty()) continue;
        if (line == 0) line = fl.line;
        ids.push_back(std::move(v));
      }
      if (!ids.empty()) put(e, attr, Value::strings(std::move(ids)), Site{&f, line});
    }
  }

  void add_plan(const text::ParsedTextFile& f) {
    const std::string& id = f.source.id;
    Entity& e = model_.upsert(kPlan, id);
    const text::RawRecord& root = f.root();
    const Site file_site{&f, 0};

    put_string(e, "title", root, "Plan Title", f);
    put_string(e, "short_id", root, "Short Identifier", f);
    put_string(e, "program_version", root, "Program Version", f);
    put_string(e, "simulation_date", root, "Simulation Date", f);

    for (const auto& [field, attr] : {std::pair<const char*, const char*>{"Geom File", "geom_file"},
                                      std::pair<const char*, const char*>{"Flow File", "flow_file"}}) {
      if (const text::Field* fl = present(root, field)) {
        const std::string v = to_lower(trim(fl->value.as_string()));
        if (v.empty()) continue;
        put(e, attr, Value::string(v), Site{&f, fl->line});
        if (std::string(attr) == "flow_file") e.relate("flow", EntityKey{kFlow, v});
        else e.relate("geometry", EntityKey{kGeometryLink, v});
      }
    }

    put_number(e, "plan_type", root, "Plan Type", f);
    put_number(e, "profiles", root, "Profiles", f);
    if (const text::Field* pn = present(root, "Profile Names")) {
      put(e, "profile_names", Value::strings(pn->value.as_strings()), Site{&f, pn->line});
    }
    put_flag(e, "paused", root, "Paused", f);
    if (const text::Field* fr = present(root, "Flow Regime")) {
      put(e, "flow_regime", Value::string(flow_regime_name(fr->value.as_string())), Site{&f, fr->line});
    }
    put_number(e, "flow_tolerance", root, "Flow Tolerance", f);
    put_number(e, "wl_tolerance", root, "Wl Tolerance", f);
    put_number(e, "friction_slope_method", root, "Friction Slope Method", f);
    put_number(e, "log_output_level", root, "Log Output Level", f);
    put_flag(e, "critical_always_calculated", root, "Critical Always Calculated", f);
    put_flag(e, "split_flow", root, "Split Flow Opt", f);
    put_flag(e, "warm_up", root, "Warm Up", f);
    put_flag(e, "check_data", root, "Check Data", f);

    const std::pair<const char*, const char*> intervals[] = {
        {"Computation Interval", "computation_interval"},
        {"Output Interval", "output_interval"},
        {"Mapping Interval", "mapping_interval"},
        {"Hydrograph Output Interval", "hydrograph_output_interval"},
        {"Detailed Output Interval", "detailed_output_interval"},
        {"Instantaneous Interval", "instantaneous_interval"},
    };
    for (const auto& [field, attr] : intervals) put_string(e, attr, root, field, f);

    const std::pair<const char*, const char*> runs[] = {
        {"Run HTab", "run_htab"},          {"Run Post Process", "run_post_process"},
        {"Run Sed", "run_sediment"},       {"Run UNET", "run_unet"},
        {"Run RAS Mapper", "run_ras_mapper"}, {"Write IC File", "write_ic_file"},
        {"Write Detailed", "write_detailed"}, {"Echo Input", "echo_input"},
        {"Echo Parameters", "echo_parameters"}, {"Echo Output", "echo_output"},
    };
    for (const auto& [field, attr] : runs) put_flag(e, attr, root, field, f);

    // Floodway encroachment.
    bool enabled = false;
    if (const text::Field* ep = present(root, "Encroach Param")) {
      const auto& v = ep->value.as_numbers();
      enabled = !v.empty() && std::isfinite(v[0]) && v[0] != 0.0;
    }
    double method = 0.0;
    if (const text::Field* em = present(root, "Encroach Method")) method = em->value.as_number();
    std::vector<double> vals(4, 0.0);
    for (int k = 0; k < 4; ++k) {
      if (const text::Field* ev = present(root, "Encroach Val " + std::to_string(k + 1))) {
        vals[k] = ev->value.as_number();
      }
    }
    const bool floodway = enabled && (method == 4.0 || method == 5.0);
    put(e, "encroachment_enabled", Value::boolean(enabled), file_site);
    put(e, "encroachment_method", Value::number(method), file_site);
    put(e, "encroachment_values", Value::numbers(vals), file_site);
    put(e, "is_floodway", Value::boolean(floodway), file_site);
    if (floodway) put(e, "target_surcharge", Value::number(vals[0]), file_site);

    bool steady = false;
    if (const text::Field* pt = present(root, "Plan Type")) {
      steady = pt->value.as_number() == 1.0;
    } else if (const text::Field* ff = present(root, "Flow File")) {
      steady = to_lower(trim(ff->value.as_string())).rfind('f', 0) == 0;
    }
    put(e, "is_steady", Value::boolean(steady), file_site);
    put(e, "active", Value::boolean(id == active_plan_), file_site);
  }

  void add_steady_flow(const text::ParsedTextFile& f) {
    const std::string& id = f.source.id;
    Entity& flow = model_.upsert(kFlow, id);
    const text::RawRecord& root = f.root();
    const Site file_site{&f, 0};

    put_string(flow, "title", root, "Flow Title", f);
    put_string(flow, "program_version", root, "Program Version", f);
    put(flow, "regime", Value::string("steady"), file_site);
    put_number(flow, "profile_count", root, "Number of Profiles", f);

    std::vector<std::string> names;
    if (const text::Field* pn = present(root, "Profile Names")) {
      names = pn->value.as_strings();
      put(flow, "profile_names", Value::strings(names), Site{&f, pn->line});
      for (const auto& n : names) {
        Entity& p = model_.upsert(kProfile, n);
        put(p, "name", Value::string(n), Site{&f, pn->line});
      }
    }

    std::size_t boundaries = 0;
    std::size_t changes = 0;
    for (const auto& rec : f.records) {
      if (rec.section == "flow_change") {
        if (add_flow_change(f, rec)) ++changes;
      } else if (rec.section == "boundary") {
        if (add_steady_boundary(f, rec, names)) ++boundaries;
      }
    }
    put(flow, "boundary_count", Value::number(static_cast<double>(boundaries)), file_site);
    put(flow, "flow_change_count", Value::number(static_cast<double>(changes)), file_site);
  }

  bool add_flow_change(const text::ParsedTextFile& f, const text::RawRecord& rec) {
    const text::Field* op = rec.find("River Rch & RM");
    const auto parts = op ? op->value.as_strings() : std::vector<std::string>{};
    if (parts.size() < 3) {
      warn(f.source.path + ":" + std::to_string(rec.line) + ": flow change without river/reach/station skipped");
      return false;
    }
    const std::string rid = reach_id(parts[0], parts[1]);
    Entity& c = model_.upsert(kFlowChange, f.source.id + "/" + rid + "/" + canonical_station(parts[2]));
    const Site at{&f, rec.line};
    put(c, "river", Value::string(trim(parts[0])), at);
    put(c, "reach", Value::string(trim(parts[1])), at);
    put_station(c, parts[2], at);
    if (const text::Field* fl = present(rec, "Flows")) {
      const auto& q = fl->value.as_numbers();
      put(c, "flows", Value::numbers(q), at);
      if (const auto mx = max_finite(q)) put(c, "max_flow", Value::number(*mx), at);
      if (const auto mn = min_finite(q)) put(c, "min_flow", Value::number(*mn), at);
    }
    c.relate("flow", EntityKey{kFlow, f.source.id});
    c.relate("reach", EntityKey{kReach, rid});
    return true;
  }

  bool add_steady_boundary(const text::ParsedTextFile& f, const text::RawRecord& rec,
                           const std::vector<std::string>& names) {
    const text::Field* op = rec.find("Boundary for River Rch & Prof#");
    const auto parts = op ? op->value.as_strings() : std::vector<std::string>{};
    if (parts.size() < 3) {
      warn(f.source.path + ":" + std::to_string(rec.line) + ": boundary without river/reach/profile skipped");
      return false;
    }
    const std::string rid = reach_id(parts[0], parts[1]);
    const auto prof = try_parse_double(parts[2]);
    Entity& b = model_.upsert(kBoundary, f.source.id + "/" + rid + "/P" +
                                             (prof ? format_number(*prof) : trim(parts[2])));
    const Site at{&f, rec.line};
    put(b, "river", Value::string(trim(parts[0])), at);
    put(b, "reach", Value::string(trim(parts[1])), at);
    put(b, "regime", Value::string("steady"), at);
    put(b, "flow_file", Value::string(f.source.id), at);
    if (prof) {
      put(b, "profile", Value::number(*prof), at);
      const long idx = static_cast<long>(*prof);
      if (idx >= 1 && static_cast<std::size_t>(idx) <= names.size()) {
        put(b, "profile_name", Value::string(names[static_cast<std::size_t>(idx - 1)]), at);
      }
    }

    double up = 0.0;
    double dn = 0.0;
    if (const text::Field* u = present(rec, "Up Type")) up = u->value.as_number();
    if (const text::Field* d = present(rec, "Dn Type")) dn = d->value.as_number();
    put(b, "upstream_type", Value::number(up), at);
    put(b, "downstream_type", Value::number(dn), at);
    put(b, "upstream_type_name", Value::string(steady_boundary_name(up)), at);
    put(b, "downstream_type_name", Value::string(steady_boundary_name(dn)), at);
    put(b, "defined", Value::boolean(up != 0.0 || dn != 0.0), at);
    put_number(b, "downstream_slope", rec, "Dn Slope", f);
    put_number(b, "upstream_slope", rec, "Up Slope", f);
    put_number(b, "downstream_known_ws", rec, "Dn Known WS", f);
    put_number(b, "upstream_known_ws", rec, "Up Known WS", f);

    b.relate("flow", EntityKey{kFlow, f.source.id});
    b.relate("reach", EntityKey{kReach, rid});
    return true;
  }

  void add_unsteady_flow(const text::ParsedTextFile& f) {
    const std::string& id = f.source.id;
    Entity& flow = model_.upsert(kFlow, id);
    const text::RawRecord& root = f.root();
    const Site file_site{&f, 0};
    const std::string regime = f.source.kind == FileKind::kQuasiFlow ? "quasi_unsteady" : "unsteady";

    put_string(flow, "title", root, "Flow Title", f);
    put_string(flow, "program_version", root, "Program Version", f);
    put(flow, "regime", Value::string(regime), file_site);
    put_flag(flow, "use_restart", root, "Use Restart", f);

    std::size_t boundaries = 0;
    for (const auto& rec : f.records) {
      if (rec.section != "boundary") continue;
      const text::Field* op = rec.find("Boundary Location");
      const auto parts = op ? op->value.as_strings() : std::vector<std::string>{};
      const Site at{&f, rec.line};

      std::string bid;
      std::string rid;
      if (parts.size() >= 3 && !trim(parts[0]).empty()) {
        rid = reach_id(parts[0], parts[1]);
        bid = id + "/" + rid + "/" + canonical_station(parts[2]);
      } else {
        // Storage areas and connections leave river/reach/station blank.
        std::vector<std::string> named;
        for (const auto& p : parts) {
          if (!trim(p).empty()) named.push_back(trim(p));
        }
        if (named.empty()) {
          warn(f.source.path + ":" + std::to_string(rec.line) + ": boundary location without a name skipped");
          continue;
        }
        bid = id + "/" + join(named, "/");
      }

      Entity& b = model_.upsert(kBoundary, bid);
      ++boundaries;
      put(b, "regime", Value::string(regime), at);
      put(b, "flow_file", Value::string(id), at);
      if (!rid.empty()) {
        put(b, "river", Value::string(trim(parts[0])), at);
        put(b, "reach", Value::string(trim(parts[1])), at);
        put_station(b, parts[2], at);
        b.relate("reach", EntityKey{kReach, rid});
      }
      b.relate("flow", EntityKey{kFlow, id});

      std::string type = "unknown";
      for (const auto& [field, name] : kHydrographTables) {
        if (const text::Field* t = present(rec, field)) {
          type = name;
          const auto& v = t->value.as_numbers();
          put(b, "hydrograph_count", Value::number(static_cast<double>(v.size())), Site{&f, t->line});
          if (const auto peak = max_finite(v)) put(b, "hydrograph_peak", Value::number(*peak), Site{&f, t->line});
          break;
        }
      }
      if (const text::Field* fs = present(rec, "Friction Slope")) {
        if (type == "unknown") type = "normal_depth";
        const auto& v = fs->value.as_numbers();
        if (!v.empty() && std::isfinite(v[0])) put(b, "friction_slope", Value::number(v[0]), Site{&f, fs->line});
      }
      put(b, "boundary_type", Value::string(type), at);
      put(b, "defined", Value::boolean(type != "unknown"), at);
      put_string(b, "interval", rec, "Interval", f);
      put_flag(b, "use_dss", rec, "Use DSS", f);
      put_string(b, "dss_file", rec, "DSS File", f);
      put_string(b, "dss_path", rec, "DSS Path", f);
    }
    put(flow, "boundary_count", Value::number(static_cast<double>(boundaries)), file_site);
  }

  void add_geometry(const text::ParsedTextFile& f) {
    std::string river;
    std::string reach;
    bool in_reach = false;

    for (const auto& rec : f.records) {
      const Site at{&f, rec.line};
      if (rec.section == "reach") {
        const text::Field* op = rec.find("River Reach");
        const auto parts = op ? op->value.as_strings() : std::vector<std::string>{};
        if (parts.size() < 2) {
          warn(f.source.path + ":" + std::to_string(rec.line) + ": reach without river/reach names skipped");
          in_reach = false;
          continue;
        }
        river = trim(parts[0]);
        reach = trim(parts[1]);
        in_reach = true;
        Entity& r = model_.upsert(kReach, reach_id(river, reach));
        put(r, "river", Value::string(river), at);
        put(r, "reach", Value::string(reach), at);
        continue;
      }
      if (rec.section != "node") continue;

      const text::Field* op = rec.find("Type RM Length L Ch R");
      const auto parts = op ? op->value.as_strings() : std::vector<std::string>{};
      const auto type = parts.empty() ? std::nullopt : try_parse_double(parts[0]);
      if (!in_reach || parts.size() < 2 || !type) {
        warn(f.source.path + ":" + std::to_string(rec.line) + ": node outside a reach or without type/station skipped");
        continue;
      }
      const int node_type = static_cast<int>(*type);
      if (node_type == 1) {
        add_node(f, rec, parts, river, reach, kCrossSection);
      } else if (node_type == 3 || node_type == 6) {
        add_node(f, rec, parts, river, reach, kBridge);
      } else {
        log_debug(f.source.path + ":" + std::to_string(rec.line) + ": node type " +
                  std::to_string(node_type) + " not modelled");
      }
    }
  }

  void add_node(const text::ParsedTextFile& f, const text::RawRecord& rec,
                const std::vector<std::string>& parts, const std::string& river,
                const std::string& reach, const char* type) {
    const std::string rid = reach_id(river, reach);
    const std::string eid = rid + "/" + canonical_station(parts[1]);
    Entity& e = model_.upsert(type, eid);
    const Site at{&f, rec.line};

    put(e, "river", Value::string(river), at);
    put(e, "reach", Value::string(reach), at);
    put_station(e, parts[1], at);
    put(e, "interpolated", Value::boolean(!trim(parts[1]).empty() && trim(parts[1]).back() == '*'), at);
    const char* lengths[] = {"length_left", "length_channel", "length_right"};
    for (std::size_t k = 0; k < 3; ++k) {
      if (parts.size() > k + 2) {
        if (const auto d = try_parse_double(parts[k + 2])) put(e, lengths[k], Value::number(*d), at);
      }
    }
    put_string(e, "node_name", rec, "Node Name", f);
    put_string(e, "description", rec, "DESCRIPTION", f);
    e.relate("reach", EntityKey{kReach, rid});

    if (std::string(type) == kCrossSection) {
      put_numbers(e, "sta_elev", rec, "#Sta/Elev", f);
      put_numbers(e, "mann_table", rec, "#Mann", f);
      if (const text::Field* bs = present(rec, "Bank Sta")) {
        const auto& v = bs->value.as_numbers();
        if (!v.empty() && std::isfinite(v[0])) put(e, "left_bank_station", Value::number(v[0]), Site{&f, bs->line});
        if (v.size() > 1 && std::isfinite(v[1])) put(e, "right_bank_station", Value::number(v[1]), Site{&f, bs->line});
      }
      if (const text::Field* ec = present(rec, "Exp/Cntr")) {
        const auto& v = ec->value.as_numbers();
        if (!v.empty() && std::isfinite(v[0])) put(e, "expansion_coef", Value::number(v[0]), Site{&f, ec->line});
        if (v.size() > 1 && std::isfinite(v[1])) put(e, "contraction_coef", Value::number(v[1]), Site{&f, ec->line});
      }
      if (const text::Field* ie = present(rec, "#IEffective")) {
        put(e, "ineffective_count", Value::number(static_cast<double>(ie->value.as_numbers().size() / 6)), Site{&f, ie->line});
      }
      if (const text::Field* lv = present(rec, "#Levee")) {
        put(e, "levee_count", Value::number(static_cast<double>(lv->value.as_numbers().size() / 3)), Site{&f, lv->line});
      }
      return;
    }

    // Bridge.
    if (const text::Field* deck = present(rec, "#Deck/Roadway")) {
      put(e, "deck_table", Value::numbers(deck->value.as_numbers()), Site{&f, deck->line});
      const auto hdr = split(deck->header, ',');
      if (hdr.size() > 1) {
        if (const auto w = try_parse_double(trim(hdr[1]))) put(e, "deck_width", Value::number(*w), Site{&f, deck->line});
      }
    }
    put_numbers(e, "us_boundary_sta", rec, "US Boundary Condition Sta", f);
    put_numbers(e, "ds_boundary_sta", rec, "DS Boundary Condition Sta", f);
    put_number(e, "skew", rec, "Bridge Skew", f);
    put_numbers(e, "modeling_approach", rec, "Bridge Modeling Approach", f);
    put_numbers(e, "energy_coefs", rec, "Bridge Coef Energy", f);
    put_numbers(e, "yarnell_coefs", rec, "Bridge Coef PI Yarnell", f);
    put_number(e, "momentum_coef", rec, "Bridge Coef Momentum", f);

    // Each "Pier Skew" starts a pier; its first elevation table is the one used.
    std::vector<Pier> piers;
    for (const auto& fl : rec.fields) {
      if (fl.name == "Pier Skew") {
        piers.emplace_back();
      } else if (piers.empty()) {
        continue;
      } else if (fl.name == "Center Sta Upstream") {
        piers.back().center_upstream = fl.value.as_number();
      } else if (fl.name == "#Pier Elev" && !piers.back().has_table) {
        piers.back().elev_width = fl.value.as_numbers();
        piers.back().has_table = true;
      }
    }
    std::vector<double> centers;
    for (const auto& p : piers) centers.push_back(p.center_upstream);
    put(e, "pier_centers", Value::numbers(centers), at);
    piers_[eid] = std::move(piers);
  }

  // ------------------------------------------------------------- derived
  void derive_cross_section(Entity& e) {
    const Attribute* mann = e.attribute("mann_table");
    const Attribute* lb = e.attribute("left_bank_station");
    const Attribute* rb = e.attribute("right_bank_station");

    if (mann && mann->value.kind() == ValueKind::kNumberList) {
      const auto& t = mann->value.as_numbers();
      // #Mann entries are (n, start station, flag).
      std::vector<std::pair<double, double>> regions;  // (start station, n)
      for (std::size_t k = 0; k + 1 < t.size(); k += 3) regions.emplace_back(t[k + 1], t[k]);
      if (!regions.empty()) {
        put_derived(e, "manning_region_count", Value::number(static_cast<double>(regions.size())), mann->origin);
        std::optional<double> channel;
        if (lb && lb->value.is_number()) {
          channel = regions.back().second;
          for (const auto& r : regions) {
            if (std::isfinite(r.first) && r.first >= lb->value.as_number()) {
              channel = r.second;
              break;
            }
          }
        }
        const std::pair<const char*, std::optional<double>> zones[] = {
            {"manning_n_left", regions.front().second},
            {"manning_n_channel", channel},
            {"manning_n_right", regions.back().second},
        };
        for (const auto& [attr, n] : zones) {
          if (!n) continue;
          if (!std::isfinite(*n)) {
            warn(e.key().to_string() + ": " + attr + " is not numeric in " + mann->source +
                 "; attribute left unset");
            continue;
          }
          put_derived(e, attr, Value::number(*n), mann->origin);
        }
      }
    }

    if (lb && rb && lb->value.is_number() && rb->value.is_number()) {
      const Origin o = (lb->origin == Origin::kResult || rb->origin == Origin::kResult)
                           ? Origin::kResult
                           : Origin::kDesign;
      put_derived(e, "channel_width", Value::number(rb->value.as_number() - lb->value.as_number()), o);
    }

    if (const Attribute* se = e.attribute("sta_elev")) {
      const auto& v = se->value.as_numbers();
      std::vector<double> elev;
      for (std::size_t k = 1; k < v.size(); k += 2) elev.push_back(v[k]);
      put_derived(e, "point_count", Value::number(static_cast<double>(v.size() / 2)), se->origin);
      if (const auto th = min_finite(elev)) put_derived(e, "thalweg", Value::number(*th), se->origin);
    }
  }

  void derive_bridge(Entity& e) {
    std::optional<double> low_chord;
    if (const Attribute* deck = e.attribute("deck_table")) {
      const auto& t = deck->value.as_numbers();
      std::vector<double> low;
      std::vector<double> high;
      for (std::size_t k = 0; k + 2 < t.size(); k += 3) {
        high.push_back(t[k + 1]);
        low.push_back(t[k + 2]);
      }
      low_chord = min_finite(low);
      if (low_chord) put_derived(e, "min_low_chord", Value::number(*low_chord), deck->origin);
      if (const auto hc = min_finite(high)) put_derived(e, "min_high_chord", Value::number(*hc), deck->origin);
    }
    if (const Attribute* us = e.attribute("us_boundary_sta")) {
      const auto& v = us->value.as_numbers();
      if (v.size() >= 2 && std::isfinite(v[0]) && std::isfinite(v[1])) {
        put_derived(e, "opening_width", Value::number(std::fabs(v[1] - v[0])), us->origin);
      }
    }

    const auto it = piers_.find(e.id());
    const std::size_t count = it == piers_.end() ? 0 : it->second.size();
    put_derived(e, "pier_count", Value::number(static_cast<double>(count)), Origin::kDesign);
    if (low_chord) {
      double total = 0.0;
      if (it != piers_.end()) {
        for (const auto& p : it->second) total += pier_width_at(p.elev_width, *low_chord);
      }
      put_derived(e, "total_pier_width", Value::number(total), Origin::kDesign);
    }
  }

  void derive_model();

  const MergeSettings& settings_;
  const IMergePolicy& policy_;
  HydraulicModel& model_;

  std::string active_plan_;
  std::set<std::string> active_links_;
  std::map<std::string, std::vector<Pier>> piers_;  // bridge id -> piers
};

void ModelAssembly::add_result(const results::ParsedResultFile& f) {
  const results::ResultLayout* layout = results::ResultLayoutRegistry::builtin().by_name(f.layout_name);
  if (!layout) {
    warn(f.source.path + ": no result layout named '" + f.layout_name + "'; datasets not merged");
    return;
  }
  const std::string& sid = f.source.id;
  const auto label = [&f](const std::string& path) { return f.source.path + "@" + path; };

  // Plan-level markers.
  Entity& plan = model_.upsert(kPlan, sid);
  put_result(plan, "has_results", Value::boolean(true), f.source.path, sid);
  put_result(plan, "result_file_version", Value::string(f.file_version), f.source.path, sid);
  if (const results::RawDataset* info = f.find(layout->plan_information)) {
    for (const auto& [name, v] : info->attributes) {
      if (name != "Plan ShortID" && name != "Plan Title") continue;
      if (const auto* s = std::get_if<std::string>(&v)) {
        put_result(plan, name == "Plan ShortID" ? "result_short_id" : "result_title",
                   Value::string(trim(*s)), label(layout->plan_information), sid);
      }
    }
  }

  // Profile names.
  std::vector<std::string> profile_names;
  if (const results::RawDataset* pn = f.find(layout->profile_names)) {
    for (const auto& s : pn->strings) profile_names.push_back(trim(s));
    put_result(plan, "result_profile_names", Value::strings(profile_names), label(pn->path), sid);
    for (const auto& n : profile_names) {
      if (!model_.find(kProfile, n)) {
        put_result(model_.upsert(kProfile, n), "name", Value::string(n), label(pn->path), sid);
      }
    }
  }

  // Cross sections.
  const std::string base = layout->xs_attributes + "/";
  const results::RawDataset* rivers = f.find(base + "River");
  const results::RawDataset* reaches = f.find(base + "Reach");
  const results::RawDataset* stations = f.find(base + "RS");
  if (!rivers || !reaches || !stations) return;
  const std::size_t n = std::min({rivers->strings.size(), reaches->strings.size(), stations->strings.size()});

  std::vector<Entity*> xs(n, nullptr);
  for (std::size_t j = 0; j < n; ++j) {
    const std::string rid = reach_id(rivers->strings[j], reaches->strings[j]);
    const std::string eid = rid + "/" + canonical_station(stations->strings[j]);
    if (model_.find(kBridge, eid)) {
      log_debug(f.source.path + ": result row " + std::to_string(j) + " names bridge " + eid);
      continue;
    }
    Entity* e = model_.find_mutable(kCrossSection, eid);
    if (!e) {
      e = &model_.upsert(kCrossSection, eid);
      const std::string src = label(base + "RS");
      if (!model_.find(kReach, rid)) {
        Entity& r = model_.upsert(kReach, rid);
        put_result(r, "river", Value::string(trim(rivers->strings[j])), src, sid);
        put_result(r, "reach", Value::string(trim(reaches->strings[j])), src, sid);
      }
      put_result(*e, "river", Value::string(trim(rivers->strings[j])), src, sid);
      put_result(*e, "reach", Value::string(trim(reaches->strings[j])), src, sid);
      const std::string st = canonical_station(stations->strings[j]);
      put_result(*e, "station_id", Value::string(st), src, sid);
      if (const auto d = try_parse_double(st)) put_result(*e, "station", Value::number(*d), src, sid);
      put_result(*e, "interpolated", Value::boolean(!st.empty() && st.back() == '*'), src, sid);
      e->relate("reach", EntityKey{kReach, rid});
    }
    xs[j] = e;
  }

  for (const auto& m : layout->xs_members) {
    const results::RawDataset* ds = f.find(base + m.dataset);
    if (!ds || ds->is_string()) continue;
    for (std::size_t j = 0; j < n && j < ds->numbers.size(); ++j) {
      if (!xs[j] || !std::isfinite(ds->numbers[j])) continue;
      put_result(*xs[j], m.attribute, Value::number(ds->numbers[j]), label(ds->path), sid);
    }
  }

  for (const auto& o : layout->xs_outputs) {
    const results::RawDataset* ds = f.find(layout->xs_output + "/" + o.dataset);
    if (!ds || ds->is_string() || ds->shape.size() != 2) continue;
    const std::size_t profiles = ds->shape[0];
    if (ds->shape[1] != n) {
      warn(label(ds->path) + ": " + std::to_string(ds->shape[1]) + " columns for " +
           std::to_string(n) + " cross sections; dataset not merged");
      continue;
    }
    for (std::size_t j = 0; j < n; ++j) {
      if (!xs[j]) continue;
      std::vector<double> per_profile;
      per_profile.reserve(profiles);
      for (std::size_t p = 0; p < profiles; ++p) per_profile.push_back(ds->at(p, j));
      put_result(*xs[j], o.attribute, Value::numbers(std::move(per_profile)), label(ds->path), sid);
    }
  }
}

void ModelAssembly::derive() {
  for (auto& [key, e] : model_.entities_) {
    if (key.type == kCrossSection) derive_cross_section(e);
    else if (key.type == kBridge) derive_bridge(e);
  }

  // Per-reach counts.
  std::map<std::string, std::pair<std::size_t, std::size_t>> per_reach;
  for (const auto& [key, e] : model_.entities_) {
    if (key.type != kCrossSection && key.type != kBridge) continue;
    if (const EntityKey* r = e.related("reach")) {
      auto& c = per_reach[r->id];
      if (key.type == kCrossSection) ++c.first;
      else ++c.second;
    }
  }
  for (auto& [key, e] : model_.entities_) {
    if (key.type != kReach) continue;
    const auto c = per_reach[key.id];
    put_derived(e, "cross_section_count", Value::number(static_cast<double>(c.first)), Origin::kDesign);
    put_derived(e, "bridge_count", Value::number(static_cast<double>(c.second)), Origin::kDesign);
  }

  // Profile index from the first flow (canonical order) that lists it.
  for (const Entity* flow : model_.of_type(kFlow)) {
    const Value listed = flow->get("profile_names");
    const auto& names = listed.as_strings();
    for (std::size_t i = 0; i < names.size(); ++i) {
      Entity* p = model_.find_mutable(kProfile, names[i]);
      if (p && !p->attribute("index")) {
        put_derived(*p, "index", Value::number(static_cast<double>(i + 1)), Origin::kDesign);
        p->relate("flow", flow->key());
      }
    }
  }

  derive_model();
}

void ModelAssembly::derive_model() {
  Entity& m = model_.upsert(kModel, "model");
  const auto count = [this](const char* type) {
    return Value::number(static_cast<double>(model_.of_type(type).size()));
  };
  put_derived(m, "project_count", count(kProject), Origin::kDesign);
  put_derived(m, "plan_count", count(kPlan), Origin::kDesign);
  put_derived(m, "flow_count", count(kFlow), Origin::kDesign);
  put_derived(m, "reach_count", count(kReach), Origin::kDesign);
  put_derived(m, "cross_section_count", count(kCrossSection), Origin::kDesign);
  put_derived(m, "bridge_count", count(kBridge), Origin::kDesign);
  put_derived(m, "boundary_count", count(kBoundary), Origin::kDesign);
  put_derived(m, "source_count", Value::number(static_cast<double>(model_.sources_.size())), Origin::kDesign);

  if (!active_plan_.empty()) put_derived(m, "active_plan", Value::string(active_plan_), Origin::kDesign);

  // Profiles of the active plan's flow when known, else every flow's in order.
  std::vector<std::string> names;
  const Entity* active = active_plan_.empty() ? nullptr : model_.find(kPlan, active_plan_);
  const EntityKey* active_flow = active ? active->related("flow") : nullptr;
  for (const Entity* flow : model_.of_type(kFlow)) {
    if (active_flow && flow->id() != active_flow->id) continue;
    const Value listed = flow->get("profile_names");
    for (const auto& n : listed.as_strings()) {
      if (std::find(names.begin(), names.end(), n) == names.end()) names.push_back(n);
    }
  }
  put_derived(m, "profile_names", Value::strings(names), Origin::kDesign);
  put_derived(m, "profile_count", Value::number(static_cast<double>(names.size())), Origin::kDesign);

  bool has_results = false;
  bool floodway = false;
  std::optional<double> surcharge;
  for (const Entity* p : model_.of_type(kPlan)) {
    has_results = has_results || p->get("has_results").as_bool();
    if (p->get("is_floodway").as_bool()) {
      floodway = true;
      const Value s = p->get("target_surcharge");
      if (s.is_number() && (!surcharge || p->id() == active_plan_)) surcharge = s.as_number();
    }
  }
  put_derived(m, "has_results", Value::boolean(has_results), Origin::kDesign);
  put_derived(m, "has_floodway", Value::boolean(floodway), Origin::kDesign);
  if (surcharge) put_derived(m, "target_surcharge", Value::number(*surcharge), Origin::kDesign);

  for (const Entity* p : model_.of_type(kProject)) {
    const Value u = p->get("units");
    if (u.is_string()) {
      put_derived(m, "units", u, Origin::kDesign);
      break;
    }
  }

  std::vector<double> ns;
  for (const Entity* x : model_.of_type(kCrossSection)) {
    for (const char* z : {"manning_n_left", "manning_n_channel", "manning_n_right"}) {
      const Value v = x->get(z);
      if (v.is_number()) ns.push_back(v.as_number());
    }
  }
  if (const auto lo = min_finite(ns)) put_derived(m, "min_manning_n", Value::number(*lo), Origin::kDesign);
  if (const auto hi = max_finite(ns)) put_derived(m, "max_manning_n", Value::number(*hi), Origin::kDesign);
}

} // namespace detail

ModelBuilder::ModelBuilder(MergeSettings settings, const IMergePolicy& policy)
    : settings_(std::move(settings)), policy_(policy) {}

HydraulicModel ModelBuilder::build(std::vector<text::ParsedTextFile> text_files,
                                   std::vector<results::ParsedResultFile> result_files) const {
  std::sort(text_files.begin(), text_files.end(),
            [](const text::ParsedTextFile& a, const text::ParsedTextFile& b) {
              return source_less(a.source, b.source);
            });
  std::sort(result_files.begin(), result_files.end(),
            [](const results::ParsedResultFile& a, const results::ParsedResultFile& b) {
              return source_less(a.source, b.source);
            });

  HydraulicModel model;
  detail::ModelAssembly b(settings_, policy_, model);
  b.record_sources(text_files, result_files);
  b.select_active_plan(text_files);
  for (const auto& f : text_files) b.add_text(f);
  for (const auto& f : result_files) b.add_result(f);
  b.derive();

  log_debug("model built: " + std::to_string(model.size()) + " entities from " +
            std::to_string(model.sources().size()) + " sources (policy " + policy_.name() +
            (b.active_plan().empty() ? std::string(", no active plan)") : ", active plan " + b.active_plan() + ")"));
  return model;
}

} // namespace rascheck::model

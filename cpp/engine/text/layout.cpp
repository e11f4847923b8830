#include "engine/text/layout.hpp"

#include <algorithm>
#include <cctype>

#include "engine/core/strings.hpp"

namespace rascheck::text {

const FieldLayout* SectionLayout::field(std::string_view keyword) const noexcept {
  for (const auto& f : fields) {
    if (f.type != FieldType::kBare && f.keyword == keyword) return &f;
  }
  return nullptr;
}

const FieldLayout* SectionLayout::bare_field(std::string_view line) const noexcept {
  for (const auto& f : fields) {
    if (f.type != FieldType::kBare) continue;
    for (const auto& alt : f.alternatives) {
      if (alt == line) return &f;
    }
  }
  return nullptr;
}

std::optional<Version> Version::parse(std::string_view s) {
  const std::string t = trim(s);
  std::size_t i = 0;
  auto read_int = [&](int* out) {
    const std::size_t b = i;
    long v = 0;
    while (i < t.size() && std::isdigit(static_cast<unsigned char>(t[i]))) {
      v = v * 10 + (t[i] - '0');
      if (v > 100000) return false;
      ++i;
    }
    if (i == b) return false;
    *out = static_cast<int>(v);
    return true;
  };

  Version v;
  if (!read_int(&v.major)) return std::nullopt;
  if (i < t.size() && t[i] == '.') {
    ++i;
    if (!read_int(&v.minor)) v.minor = 0;
  }
  return v;
}

std::string Version::to_string() const {
  std::string m = std::to_string(minor);
  if (m.size() < 2) m.insert(m.begin(), '0');
  return std::to_string(major) + "." + m;
}

const FieldLayout* FileLayout::root_field(std::string_view keyword) const noexcept {
  for (const auto& f : root_fields) {
    if (f.type != FieldType::kBare && f.keyword == keyword) return &f;
  }
  return nullptr;
}

const FieldLayout* FileLayout::root_bare(std::string_view line) const noexcept {
  for (const auto& f : root_fields) {
    if (f.type != FieldType::kBare) continue;
    for (const auto& alt : f.alternatives) {
      if (alt == line) return &f;
    }
  }
  return nullptr;
}

const SectionLayout* FileLayout::section_by_opener(std::string_view keyword) const noexcept {
  for (const auto& s : sections) {
    if (!s.begin_end && s.opener == keyword) return &s;
  }
  return nullptr;
}

const SectionLayout* FileLayout::section_by_name(std::string_view name) const noexcept {
  for (const auto& s : sections) {
    if (s.name == name) return &s;
  }
  return nullptr;
}

void LayoutRegistry::add(FileLayout layout) {
  layouts_.push_back(std::move(layout));
}

const FileLayout* LayoutRegistry::select(FileKind kind,
                                         const std::optional<Version>& version) const noexcept {
  const FileLayout* best = nullptr;
  for (const auto& l : layouts_) {
    if (l.kind != kind) continue;
    if (version && !(l.min_version <= *version)) continue;
    if (!best || best->min_version < l.min_version) best = &l;
  }
  if (!best && version) {
    // Older than every descriptor: fall back to the oldest one.
    for (const auto& l : layouts_) {
      if (l.kind != kind) continue;
      if (!best || l.min_version < best->min_version) best = &l;
    }
  }
  return best;
}

std::size_t LayoutRegistry::count(FileKind kind) const noexcept {
  return static_cast<std::size_t>(std::count_if(
      layouts_.begin(), layouts_.end(), [kind](const FileLayout& l) { return l.kind == kind; }));
}

const FileLayout* LayoutRegistry::by_name(std::string_view name) const noexcept {
  for (const auto& l : layouts_) {
    if (l.name == name) return &l;
  }
  return nullptr;
}

// ----------------------------- builtin layouts -------------------------------
namespace {

FieldLayout num(std::string k) { return FieldLayout{std::move(k), FieldType::kNumber, 1, {}}; }
FieldLayout flag(std::string k) { return FieldLayout{std::move(k), FieldType::kFlag, 1, {}}; }
FieldLayout str(std::string k) { return FieldLayout{std::move(k), FieldType::kString, 1, {}}; }
FieldLayout nums(std::string k) { return FieldLayout{std::move(k), FieldType::kNumberList, 1, {}}; }
FieldLayout strs(std::string k) { return FieldLayout{std::move(k), FieldType::kStringList, 1, {}}; }
FieldLayout table(std::string k, int vpe) { return FieldLayout{std::move(k), FieldType::kTable, vpe, {}}; }
FieldLayout block(std::string k) { return FieldLayout{std::move(k), FieldType::kTextBlock, 1, {}}; }
FieldLayout bare(std::string k, std::vector<std::string> alts) {
  return FieldLayout{std::move(k), FieldType::kBare, 1, std::move(alts)};
}

SectionLayout keyword_section(std::string name, std::string opener, std::vector<FieldLayout> fields) {
  SectionLayout s;
  s.name = std::move(name);
  s.opener = std::move(opener);
  s.fields = std::move(fields);
  return s;
}

FileLayout geometry_layout(std::string name, Version min_version, Delimiter delim) {
  FileLayout g;
  g.name = std::move(name);
  g.kind = FileKind::kGeometry;
  g.min_version = min_version;
  g.table_delimiter = delim;
  g.root_fields = {str("Geom Title"), str("Program Version"), str("Viewing Rectangle"),
                   block("DESCRIPTION")};

  g.sections.push_back(keyword_section(
      "reach", "River Reach",
      {table("Reach XY", 2), str("Rch Text X Y"), num("Reverse River Text")}));

  // Cross sections (node type 1) and bridges (node type 6) share one opener;
  // the node type is the first opener value.
  g.sections.push_back(keyword_section(
      "node", "Type RM Length L Ch R",
      {
          str("Node Name"),
          str("Node Last Edited Time"),
          block("DESCRIPTION"),
          table("#Sta/Elev", 2),
          table("#Mann", 3),
          nums("Bank Sta"),
          nums("Exp/Cntr"),
          table("#IEffective", 6),
          table("#Levee", 3),
          nums("Levee"),
          str("XS Rating Curve"),
          nums("XS HTab Starting El and Incr"),
          nums("XS HTab Horizontal Distribution"),
          // bridge / culvert
          table("#Deck/Roadway", 3),
          nums("BC Design Weir Coef"),
          nums("Deck Dist"),
          nums("US Boundary Condition Sta"),
          nums("DS Boundary Condition Sta"),
          num("Bridge Skew"),
          num("#Pier"),
          num("Pier Skew"),
          num("Center Sta Upstream"),
          num("Center Sta Downstream"),
          table("#Pier Elev", 2),
          nums("Bridge Modeling Approach"),
          nums("Bridge Coef Energy"),
          nums("Bridge Coef PI Yarnell"),
          num("Bridge Coef Momentum"),
          nums("Bridge WSPRO Data Coef"),
      }));
  return g;
}

FileLayout plan_layout() {
  FileLayout p;
  p.name = "plan";
  p.kind = FileKind::kPlan;
  p.root_fields = {
      str("Plan Title"), str("Program Version"), str("Short Identifier"), str("Simulation Date"),
      str("Geom File"), str("Flow File"), num("Plan Type"), num("Profiles"), strs("Profile Names"),
      flag("Paused"), block("DESCRIPTION"),
      bare("Flow Regime", {"Subcritical Flow", "Supercritical Flow", "Mixed Flow", "Mixed Flow Regime"}),
      // computation
      num("Flow Tolerance"), num("Wl Tolerance"), flag("Critical Always Calculated"),
      num("Friction Slope Method"), num("Flow Ratio"), flag("Split Flow Opt"), flag("Warm Up"),
      str("Computation Interval"), num("Flow Tolerance Method"), flag("Check Data"),
      // encroachment / floodway
      nums("Encroach Param"), num("Encroach Method"), num("Encroach Val 1"), num("Encroach Val 2"),
      num("Encroach Val 3"), num("Encroach Val 4"),
      // run flags / output
      flag("Run HTab"), flag("Run Post Process"), flag("Run Sed"), flag("Run UNET"),
      flag("Run RAS Mapper"), flag("Write IC File"), flag("Write Detailed"), flag("Echo Input"),
      flag("Echo Parameters"), flag("Echo Output"), num("Log Output Level"), str("Output Interval"),
      str("Mapping Interval"), str("Hydrograph Output Interval"), str("Detailed Output Interval"),
      str("Instantaneous Interval"),
  };
  return p;
}

FileLayout steady_flow_layout() {
  FileLayout f;
  f.name = "steady_flow";
  f.kind = FileKind::kSteadyFlow;
  f.table_delimiter = Delimiter::kFixedWidth;
  f.root_fields = {str("Flow Title"), str("Program Version"), num("Number of Profiles"),
                   strs("Profile Names"), block("DESCRIPTION")};

  SectionLayout change = keyword_section("flow_change", "River Rch & RM", {});
  change.trailing_field = "Flows";
  change.trailing_count_field = "Number of Profiles";
  f.sections.push_back(std::move(change));

  f.sections.push_back(keyword_section(
      "boundary", "Boundary for River Rch & Prof#",
      {num("Up Type"), num("Dn Type"), num("Dn Slope"), num("Up Slope"), num("Dn Known WS"),
       num("Up Known WS")}));
  return f;
}

FileLayout unsteady_flow_layout(FileKind kind, std::string name) {
  FileLayout u;
  u.name = std::move(name);
  u.kind = kind;
  u.table_delimiter = Delimiter::kFixedWidth;
  u.root_fields = {str("Flow Title"), str("Program Version"), flag("Use Restart"),
                   block("DESCRIPTION")};
  u.sections.push_back(keyword_section(
      "boundary", "Boundary Location",
      {
          str("Interval"),
          nums("Friction Slope"),
          flag("Use DSS"),
          str("DSS File"),
          str("DSS Path"),
          table("Flow Hydrograph", 1),
          table("Stage Hydrograph", 1),
          table("Lateral Inflow Hydrograph", 1),
          table("Uniform Lateral Inflow Hydrograph", 1),
          table("Gate Openings", 1),
          table("Rating Curve", 1),
          table("Precipitation Hydrograph", 1),
      }));
  return u;
}

FileLayout project_layout() {
  FileLayout p;
  p.name = "project";
  p.kind = FileKind::kProject;
  p.root_fields = {
      str("Proj Title"), str("Current Plan"), nums("Default Exp/Contr"),
      str("Geom File"), str("Steady File"), str("Unsteady File"), str("QuasiSteady File"),
      str("Plan File"), block("DESCRIPTION"),
      bare("Units", {"English Units", "SI Units", "SI Metric"}),
  };
  return p;
}

LayoutRegistry make_builtin() {
  LayoutRegistry r;
  // Before 5.0 tables were written space-separated; later versions pack
  // values into 8-character columns that may touch.
  r.add(geometry_layout("geometry_legacy", Version{0, 0}, Delimiter::kWhitespace));
  r.add(geometry_layout("geometry", Version{5, 0}, Delimiter::kFixedWidth));
  r.add(plan_layout());
  r.add(steady_flow_layout());
  r.add(unsteady_flow_layout(FileKind::kUnsteadyFlow, "unsteady_flow"));
  r.add(unsteady_flow_layout(FileKind::kQuasiFlow, "quasi_flow"));
  r.add(project_layout());
  return r;
}

} // namespace

const LayoutRegistry& LayoutRegistry::builtin() {
  static const LayoutRegistry kRegistry = make_builtin();
  return kRegistry;
}

} // namespace rascheck::text

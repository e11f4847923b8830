#include "engine/results/result_layout.hpp"

#include <cctype>
#include <utility>

namespace rascheck::results {

std::vector<std::string> ResultLayout::globs() const {
  std::vector<std::string> g;
  if (!plan_information.empty()) g.push_back(plan_information);
  if (!xs_attributes.empty()) g.push_back(xs_attributes);
  if (!profile_names.empty()) g.push_back(profile_names);
  if (!xs_output.empty()) g.push_back(xs_output + "/*");
  return g;
}

void ResultLayoutRegistry::add(ResultLayout layout) {
  layouts_.push_back(std::move(layout));
}

const ResultLayout* ResultLayoutRegistry::select(int major) const noexcept {
  const ResultLayout* best = nullptr;
  for (const auto& l : layouts_) {
    if (l.min_major > major) continue;
    if (!best || best->min_major < l.min_major) best = &l;
  }
  if (best) return best;
  for (const auto& l : layouts_) {
    if (!best || l.min_major < best->min_major) best = &l;
  }
  return best;
}

const ResultLayout* ResultLayoutRegistry::by_name(const std::string& name) const noexcept {
  for (const auto& l : layouts_) {
    if (l.name == name) return &l;
  }
  return nullptr;
}

int version_major(const std::string& file_version) noexcept {
  std::size_t i = 0;
  while (i < file_version.size() && !std::isdigit(static_cast<unsigned char>(file_version[i]))) ++i;
  if (i == file_version.size()) return -1;
  int v = 0;
  while (i < file_version.size() && std::isdigit(static_cast<unsigned char>(file_version[i]))) {
    v = v * 10 + (file_version[i] - '0');
    if (v > 100000) return -1;
    ++i;
  }
  return v;
}

namespace {

const char* kSteadyProfiles = "Results/Steady/Output/Output Blocks/Base Output/Steady Profiles";

ResultLayout v5_layout() {
  ResultLayout l;
  l.name = "results_v5";
  l.min_major = 5;
  l.plan_information = "Plan Data/Plan Information";
  l.xs_attributes = "Geometry/Cross Sections/Attributes";
  l.profile_names = std::string(kSteadyProfiles) + "/Profile Names";
  l.xs_output = std::string(kSteadyProfiles) + "/Cross Sections";
  l.xs_members = {
      {"Contr", "contraction_coef"},   {"Expan", "expansion_coef"},
      {"Left Bank", "left_bank_station"}, {"Right Bank", "right_bank_station"},
      {"Len Left", "length_left"},     {"Len Channel", "length_channel"},
      {"Len Right", "length_right"},
  };
  l.xs_outputs = {
      {"Water Surface", "water_surface"},
      {"Flow", "flow"},
      {"Energy Grade", "energy_grade"},
  };
  return l;
}

ResultLayout v6_layout() {
  ResultLayout l = v5_layout();
  l.name = "results_v6";
  l.min_major = 6;
  l.xs_outputs.push_back({"Velocity Channel", "velocity_channel"});
  l.xs_outputs.push_back({"Velocity Total", "velocity_total"});
  l.xs_outputs.push_back({"Flow Area", "flow_area"});
  l.xs_outputs.push_back({"Top Width", "top_width"});
  return l;
}

ResultLayoutRegistry make_builtin() {
  ResultLayoutRegistry r;
  r.add(v5_layout());
  r.add(v6_layout());
  return r;
}

} // namespace

const ResultLayoutRegistry& ResultLayoutRegistry::builtin() {
  static const ResultLayoutRegistry kRegistry = make_builtin();
  return kRegistry;
}

} // namespace rascheck::results

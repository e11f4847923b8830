#pragma once
/*
================================================================================
Fragment 5.5 — Rules: YAML Rule Loader
FILE: cpp/engine/rules/rule_loader.hpp

Document shape:
  ruleset: fema_baseline
  version: "2024.1"
  supersedes: [FEMA-FW-001]      # overlays only
  rules:
    - id: FEMA-MANN-001
      name: Channel Manning's n range
      citation: FEMA Guidelines and Standards, Appendix C
      severity: violation           # info | warning | violation (error)
      selector: {type: cross_section, where: "exists(mann_table)"}
      aggregate: false
      condition: "manning_n_channel >= params.min and manning_n_channel <= params.max"
      parameters: {min: 0.02, max: 0.15}
      message: "channel n {manning_n_channel} outside [{params.min}, {params.max}]"

Failure handling:
  - One bad rule -> RuleLoadError collected in RuleSet::load_errors; the
    remaining rules still load.
  - Unreadable file, invalid YAML or no `rules:` list -> RuleLoadError thrown
    (empty rule id) for the whole load.
================================================================================
*/

#include <string>
#include <vector>

#include "engine/core/settings.hpp"
#include "engine/rules/rule_types.hpp"

namespace rascheck::rules {

class RuleLoader {
 public:
  // Documents are applied in call order; later documents are overlays.
  void add_file(const std::string& path, const IoSettings& io);
  void add_text(const std::string& yaml, const std::string& source);

  // Finalizes the content hash and hands the set over.
  RuleSet finish();

 private:
  RuleSet set_;
};

RuleSet load_rule_files(const std::vector<std::string>& paths, const IoSettings& io);

} // namespace rascheck::rules

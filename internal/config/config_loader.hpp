#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/analysis/impact_analyzer.hpp"
#include "internal/scoring/scoring_policy.hpp"

namespace impact::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields are
  rejected.
*/
class ConfigLoader {
 public:
  static impact::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Built-in defaults overlaid with the configured values, validated.
  static scoring::ScoringPolicy ScoringPolicyFrom(const impact::runtime::config::RuntimeConfig& config);

  static analysis::AnalysisScope DefaultScopeFrom(const impact::runtime::config::RuntimeConfig& config);
};

} // namespace impact::config

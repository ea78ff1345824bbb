#include "config_loader.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/yaml_json.hpp"

namespace impact::config {

using impact::runtime::config::CriticalityTable;
using impact::runtime::config::RuntimeConfig;

namespace {

void Overlay(const CriticalityTable& configured, scoring::CriticalityTable* table) {
  if (configured.has_low()) table->low = configured.low();
  if (configured.has_medium()) table->medium = configured.medium();
  if (configured.has_high()) table->high = configured.high();
  if (configured.has_critical()) table->critical = configured.critical();
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  const auto json = util::YamlToJson(yaml);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  // fail at load time rather than at first analysis
  (void)ScoringPolicyFrom(config);
  (void)DefaultScopeFrom(config);

  return config;
}

scoring::ScoringPolicy ConfigLoader::ScoringPolicyFrom(const RuntimeConfig& config) {
  scoring::ScoringPolicy policy;
  const auto&            s = config.scoring();

  if (s.has_direct_weight()) policy.direct_weight = s.direct_weight();
  if (s.has_indirect_weight()) policy.indirect_weight = s.indirect_weight();
  if (s.has_failed_step_weight()) policy.failed_step_weight = s.failed_step_weight();
  if (s.has_depth_weight()) policy.depth_weight = s.depth_weight();
  if (s.has_breadth_weight()) policy.breadth_weight = s.breadth_weight();

  Overlay(s.workflow_weight(), &policy.workflow_weight);
  Overlay(s.criticality_multiplier(), &policy.criticality_multiplier);

  if (s.thresholds().has_medium()) policy.thresholds.medium = s.thresholds().medium();
  if (s.thresholds().has_high()) policy.thresholds.high = s.thresholds().high();
  if (s.thresholds().has_critical()) policy.thresholds.critical = s.thresholds().critical();

  scoring::ValidatePolicy(policy);
  return policy;
}

analysis::AnalysisScope ConfigLoader::DefaultScopeFrom(const RuntimeConfig& config) {
  const auto& scope = config.analysis().default_scope();
  if (scope.empty() || scope == "non-online") {
    return analysis::AnalysisScope::NonOnline();
  }
  if (scope == "all") {
    return analysis::AnalysisScope::All();
  }
  throw util::InvalidConfig("analysis.default_scope must be \"non-online\" or \"all\", got \"" + scope + "\"");
}

} // namespace impact::config

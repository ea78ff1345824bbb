#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/inventory/file_inventory_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scoring/impact_scorer.hpp"

namespace impact::factory {

Application Build(const impact::runtime::config::RuntimeConfig& config, const std::string& snapshot_path) {
  const auto policy = config::ConfigLoader::ScoringPolicyFrom(config);

  service::ServiceContext ctx;
  ctx.source   = std::make_shared<inventory::FileInventorySource>(snapshot_path);
  ctx.analyzer = std::make_shared<analysis::ImpactAnalyzer>(scoring::ImpactScorer(policy));

  Application app;
  app.service       = std::make_shared<service::AnalysisService>(std::move(ctx));
  app.default_scope = config::ConfigLoader::DefaultScopeFrom(config);

  IMPACT_LOG_DEBUG("Application built", {observability::StringField("snapshot", snapshot_path)});
  return app;
}

} // namespace impact::factory

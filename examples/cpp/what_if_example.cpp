#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "impact/v1.hpp"
#include "internal/inventory/memory_inventory_source.hpp"
#include "internal/model/labels.hpp"
#include "internal/service/analysis_service.hpp"

namespace {

impact::v1::Component MakeComponent(const std::string& id, impact::v1::ComponentType type, impact::v1::Criticality criticality) {
  impact::v1::Component component;
  component.set_id(id);
  component.set_name(id);
  component.set_type(type);
  component.set_status(impact::v1::COMPONENT_STATUS_ONLINE);
  component.set_criticality(criticality);
  return component;
}

impact::v1::Dependency MakeDependency(const std::string& source, const std::string& target) {
  impact::v1::Dependency dependency;
  dependency.set_id(source + "->" + target);
  dependency.set_source_id(source);
  dependency.set_target_id(target);
  dependency.set_type(impact::v1::DEPENDENCY_TYPE_REQUIRES);
  return dependency;
}

} // namespace

int main(int argc, char** argv) {
  // Component to take offline; defaults to the core switch.
  const std::string failing = argc > 1 ? argv[1] : "core-switch";

  auto inventory = std::make_shared<impact::inventory::MemoryInventorySource>();
  (void)inventory->UpsertComponent(MakeComponent("core-switch", impact::v1::COMPONENT_TYPE_NETWORK, impact::v1::CRITICALITY_CRITICAL));
  (void)inventory->UpsertComponent(MakeComponent("web-01", impact::v1::COMPONENT_TYPE_SERVER, impact::v1::CRITICALITY_HIGH));
  (void)inventory->UpsertComponent(MakeComponent("orders-db", impact::v1::COMPONENT_TYPE_DATABASE, impact::v1::CRITICALITY_CRITICAL));
  (void)inventory->UpsertDependency(MakeDependency("core-switch", "web-01"));
  (void)inventory->UpsertDependency(MakeDependency("core-switch", "orders-db"));

  auto result = inventory->SetStatus(failing, impact::v1::COMPONENT_STATUS_OFFLINE);
  if (!result) {
    std::cerr << "unknown component: " << result.message << '\n';
    return 1;
  }

  impact::service::ServiceContext ctx;
  ctx.source = inventory;
  impact::service::AnalysisService service(std::move(ctx));

  const auto downstream = service.Downstream();
  std::cout << failing << " offline, " << downstream.impacted_size() << " component(s) downstream\n";
  for (const auto& impacted : downstream.impacted()) {
    std::cout << "  " << impacted.component_id() << " (hop " << impacted.hop_distance() << ")\n";
  }

  const auto report = service.Analyze(impact::analysis::AnalysisScope::NonOnline());
  for (const auto& analysis : report.results()) {
    std::cout << analysis.component_id() << ": score=" << analysis.business_impact_score()
              << " risk=" << impact::model::ToString(analysis.risk_level()) << '\n';
  }

  return 0;
}

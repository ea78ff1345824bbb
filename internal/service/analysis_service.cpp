#include "analysis_service.hpp"

#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/graph/cause_attribution.hpp"
#include "internal/graph/component_index.hpp"
#include "internal/graph/dependency_validator.hpp"
#include "internal/graph/propagation.hpp"
#include "internal/inventory/inventory_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/snapshot/snapshot_validator.hpp"

namespace impact::service {

using namespace impact::v1;
using impact::observability::IntField;
using impact::observability::StringField;

namespace {

template <typename Fn>
auto Observe(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    IMPACT_LOG_DEBUG("Analysis completed", {StringField("route", route), IntField("elapsed_ms", elapsed_ms())});
    return result;
  } catch (const std::exception& ex) {
    IMPACT_LOG_ERROR("Analysis failed", {StringField("route", route), StringField("error", ex.what()), IntField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

std::vector<std::string> SortedIds(const graph::NodeSet& ids) {
  std::vector<std::string> sorted(ids.begin(), ids.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

} // namespace

AnalysisService::AnalysisService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.source) {
    throw std::invalid_argument("AnalysisService requires an inventory source");
  }
  if (!ctx_.analyzer) {
    ctx_.analyzer = std::make_shared<analysis::ImpactAnalyzer>();
  }
}

InventorySnapshot AnalysisService::AcquireSnapshot() {
  auto snapshot = ctx_.source->Load();
  snapshot::SnapshotValidator::Validate(snapshot);

  for (const auto* dependency : snapshot::SnapshotValidator::DanglingDependencies(snapshot)) {
    IMPACT_LOG_WARN("Dependency references unknown component", {StringField("dependency_id", dependency->id()),
                                                                StringField("source_id", dependency->source_id()),
                                                                StringField("target_id", dependency->target_id())});
  }

  IMPACT_LOG_DEBUG("Snapshot acquired", {IntField("components", snapshot.components_size()), IntField("dependencies", snapshot.dependencies_size()),
                                         IntField("workflows", snapshot.workflows_size())});
  return snapshot;
}

DownstreamReport AnalysisService::Downstream(const graph::NodeSet* visible_ids) {
  return Observe("downstream", [&] {
    const auto snapshot = AcquireSnapshot();
    const auto roots    = graph::OfflineRoots(snapshot.components());
    const auto impacted = graph::ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies(), visible_ids);
    const auto causes   = graph::AttributeCauses(roots, graph::BuildForwardAdjacency(snapshot.dependencies(), visible_ids));

    const graph::ComponentIndex index(snapshot.components());

    DownstreamReport report;
    for (const auto& root : roots) {
      report.add_offline_root_ids(root);
    }
    for (const auto& id : SortedIds(impacted)) {
      auto* entry = report.add_impacted();
      entry->set_component_id(id);
      entry->set_name(index.Name(id));
      if (auto it = causes.find(id); it != causes.end()) {
        entry->set_hop_distance(it->second.hop_distance);
      }
    }

    IMPACT_LOG_INFO("Downstream impact computed", {IntField("offline_roots", report.offline_root_ids_size()), IntField("impacted", report.impacted_size())});
    return report;
  });
}

CauseReport AnalysisService::Causes() {
  return Observe("causes", [&] {
    const auto snapshot = AcquireSnapshot();
    const auto causes   = graph::AttributeCauses(snapshot.components(), snapshot.dependencies());

    std::vector<std::string> ids;
    ids.reserve(causes.size());
    for (const auto& [id, _] : causes) {
      ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());

    CauseReport report;
    for (const auto& id : ids) {
      const auto& cause = causes.at(id);
      auto*       entry = report.add_causes();
      entry->set_component_id(id);
      entry->set_root_id(cause.root_id);
      entry->set_via_id(cause.via_id);
      entry->set_hop_distance(cause.hop_distance);
    }

    IMPACT_LOG_INFO("Causes attributed", {IntField("impacted", report.causes_size())});
    return report;
  });
}

WorkflowImpactReport AnalysisService::Workflows(workflow::StepView view) {
  return Observe("workflows", [&] {
    const auto snapshot = AcquireSnapshot();
    const auto impacted = graph::ComputeDownstreamImpact(snapshot.components(), snapshot.dependencies());

    const graph::ComponentIndex          index(snapshot.components());
    const workflow::WorkflowImpactMapper mapper(index, workflow::ImpactedOrOffline(impacted, snapshot.components()));

    WorkflowImpactReport report;
    for (auto& affected : mapper.AffectedWorkflows(snapshot.workflows(), view)) {
      *report.add_workflows() = std::move(affected);
    }
    for (auto& step : mapper.ImpactedSteps(snapshot.workflows())) {
      *report.add_steps() = std::move(step);
    }

    IMPACT_LOG_INFO("Workflow impact mapped", {IntField("affected_workflows", report.workflows_size()), IntField("impacted_steps", report.steps_size())});
    return report;
  });
}

AnalysisReport AnalysisService::Analyze(const analysis::AnalysisScope& scope) {
  return Observe("analyze", [&] {
    const auto snapshot = AcquireSnapshot();
    auto results = ctx_.analyzer->ComputeAnalysisResults(snapshot.components(), snapshot.dependencies(), snapshot.workflows(), scope);

    AnalysisReport report;
    *report.mutable_generated_at() = google::protobuf::util::TimeUtil::GetCurrentTime();
    for (auto& result : results) {
      if (result.risk_level() == RISK_LEVEL_CRITICAL) {
        IMPACT_LOG_WARN("Critical business impact", {StringField("component_id", result.component_id()),
                                                      IntField("score", result.business_impact_score())});
      }
      *report.add_results() = std::move(result);
    }

    IMPACT_LOG_INFO("Impact analysis completed", {IntField("results", report.results_size())});
    return report;
  });
}

ValidationReport AnalysisService::Validate() {
  return Observe("validate", [&] {
    const auto snapshot = AcquireSnapshot();
    const auto& dependencies = snapshot.dependencies();

    ValidationReport report;

    for (const auto& cycle : graph::DependencyValidator::DetectCycles(dependencies)) {
      auto* entry = report.add_cycles();
      for (const auto& id : cycle) {
        entry->add_component_ids(id);
      }
    }

    for (const auto& id : graph::DependencyValidator::SinglePointsOfFailure(dependencies)) {
      report.add_single_points_of_failure(id);
    }

    // Replay the edges in order, as if each were being added to the ones before it.
    const graph::ComponentIndex index(snapshot.components());
    Dependencies                preceding;
    for (const auto& dependency : dependencies) {
      const auto check = graph::DependencyValidator::Validate(dependency, preceding);

      std::vector<std::string> warnings;
      const auto*              source = index.Find(dependency.source_id());
      const auto*              target = index.Find(dependency.target_id());
      if (source && target) {
        warnings = graph::DependencyValidator::CheckTypeCompatibility(source->type(), target->type(), dependency.type());
      }

      if (!check.ok() || !warnings.empty()) {
        auto* issue = report.add_issues();
        issue->set_dependency_id(dependency.id());
        for (const auto& error : check.errors) {
          issue->add_errors(error);
        }
        for (const auto& warning : warnings) {
          issue->add_warnings(warning);
        }
      }

      *preceding.Add() = dependency;
    }

    IMPACT_LOG_INFO("Dependency validation completed", {IntField("cycles", report.cycles_size()), IntField("issues", report.issues_size())});
    return report;
  });
}

} // namespace impact::service

#include "internal/analysis/impact_analyzer.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/graph/adjacency.hpp"
#include "internal/graph/component_index.hpp"
#include "internal/graph/propagation.hpp"
#include "internal/workflow/workflow_impact.hpp"

namespace impact::analysis {

using namespace impact::v1;

namespace {

AnalysisResult UnknownResult(const std::string& component_id) {
  AnalysisResult result;
  result.set_component_id(component_id);
  result.set_component_name("Unknown");
  result.set_business_impact_score(0);
  result.set_risk_level(RISK_LEVEL_LOW);
  return result;
}

void AddImpacted(google::protobuf::RepeatedPtrField<ImpactedComponent>* out, const graph::ComponentIndex& index, const std::string& id,
                 std::uint32_t depth) {
  auto* impacted = out->Add();
  impacted->set_component_id(id);
  impacted->set_name(index.Name(id));
  impacted->set_hop_distance(depth);
}

AnalysisResult AnalyzeOne(const std::string& component_id, const graph::ComponentIndex& index, const graph::Adjacency& adjacency,
                          const Workflows& workflows, const scoring::ImpactScorer& scorer) {
  const auto* component = index.Find(component_id);
  if (!component) {
    return UnknownResult(component_id);
  }

  AnalysisResult result;
  result.set_component_id(component_id);
  result.set_component_name(index.Name(component_id));

  std::unordered_set<std::string> direct;
  for (const auto& next : graph::Successors(adjacency, component_id)) {
    if (next != component_id) {
      direct.insert(next);
    }
  }

  const auto     reached = graph::ReachableWithDepth(component_id, adjacency);
  graph::NodeSet affected{component_id};
  std::uint32_t  max_depth = 0;

  for (const auto& [id, depth] : reached) {
    affected.insert(id);
    max_depth = std::max(max_depth, depth);
    if (direct.contains(id)) {
      AddImpacted(result.mutable_direct_impacts(), index, id, depth);
    } else {
      AddImpacted(result.mutable_indirect_impacts(), index, id, depth);
    }
  }
  result.set_max_depth(max_depth);

  const workflow::WorkflowImpactMapper mapper(index, std::move(affected));

  scoring::ImpactProfile profile;
  profile.direct_count   = static_cast<std::size_t>(result.direct_impacts_size());
  profile.indirect_count = static_cast<std::size_t>(result.indirect_impacts_size());
  profile.max_depth      = max_depth;
  profile.criticality    = component->criticality();

  for (auto& step : mapper.ImpactedSteps(workflows)) {
    if (step.severity() == STEP_SEVERITY_FAILED) {
      profile.failed_step_count++;
    }
    *result.add_affected_steps() = std::move(step);
  }

  for (const auto& workflow : mapper.AffectedWorkflows(workflows)) {
    result.add_affected_workflow_ids(workflow.workflow_id());
    profile.affected_workflows.push_back(workflow.criticality());
  }

  const auto score = scorer.Score(profile);
  result.set_business_impact_score(score);
  result.set_risk_level(scorer.Classify(score));
  return result;
}

} // namespace

AnalysisScope AnalysisScope::Parse(const std::string& value) {
  if (value == "all") {
    return All();
  }
  if (value == "non-online") {
    return NonOnline();
  }
  return Component(value);
}

ImpactAnalyzer::ImpactAnalyzer(scoring::ImpactScorer scorer) : scorer_(std::move(scorer)) {
}

AnalysisResult ImpactAnalyzer::Analyze(const std::string& component_id, const Components& components, const Dependencies& dependencies,
                                       const Workflows& workflows) const {
  const graph::ComponentIndex index(components);
  return AnalyzeOne(component_id, index, graph::BuildForwardAdjacency(dependencies), workflows, scorer_);
}

std::vector<AnalysisResult> ImpactAnalyzer::ComputeAnalysisResults(const Components& components, const Dependencies& dependencies,
                                                                   const Workflows& workflows, const AnalysisScope& scope) const {
  const graph::ComponentIndex index(components);
  const auto                  adjacency = graph::BuildForwardAdjacency(dependencies);

  std::vector<AnalysisResult> results;
  switch (scope.kind) {
    case AnalysisScope::Kind::kComponent:
      results.push_back(AnalyzeOne(scope.component_id, index, adjacency, workflows, scorer_));
      break;
    case AnalysisScope::Kind::kAllComponents:
    case AnalysisScope::Kind::kNonOnline:
      for (const auto& component : components) {
        if (scope.kind == AnalysisScope::Kind::kNonOnline && component.status() == COMPONENT_STATUS_ONLINE) {
          continue;
        }
        results.push_back(AnalyzeOne(component.id(), index, adjacency, workflows, scorer_));
      }
      break;
  }

  std::stable_sort(results.begin(), results.end(), [](const AnalysisResult& a, const AnalysisResult& b) {
    if (a.business_impact_score() != b.business_impact_score()) {
      return a.business_impact_score() > b.business_impact_score();
    }
    return a.component_id() < b.component_id();
  });

  return results;
}

} // namespace impact::analysis

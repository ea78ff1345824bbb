#include "internal/workflow/workflow_impact.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>
#include <utility>

namespace impact::workflow {

using namespace impact::v1;

std::vector<const WorkflowStep*> SortedSteps(const BusinessWorkflow& workflow) {
  std::vector<const WorkflowStep*> steps;
  steps.reserve(workflow.steps_size());
  for (const auto& step : workflow.steps()) {
    steps.push_back(&step);
  }

  std::stable_sort(steps.begin(), steps.end(), [](const WorkflowStep* a, const WorkflowStep* b) { return a->order() < b->order(); });
  return steps;
}

std::vector<std::string> StepComponentIds(const WorkflowStep& step) {
  std::vector<std::string>        ids;
  std::unordered_set<std::string> seen;

  if (!step.primary_component_id().empty()) {
    seen.insert(step.primary_component_id());
    ids.push_back(step.primary_component_id());
  }
  for (const auto& id : step.primary_component_ids()) {
    if (!id.empty() && seen.insert(id).second) {
      ids.push_back(id);
    }
  }
  return ids;
}

WorkflowImpactMapper::WorkflowImpactMapper(const graph::ComponentIndex& index, graph::NodeSet affected)
    : index_(index), affected_(std::move(affected)) {
}

std::vector<AffectedStep> WorkflowImpactMapper::ImpactedSteps(const BusinessWorkflow& workflow) const {
  std::vector<AffectedStep> result;

  for (const auto* step : SortedSteps(workflow)) {
    std::vector<std::string> reasons;
    for (const auto& id : StepComponentIds(*step)) {
      if (affected_.contains(id)) {
        reasons.push_back(id);
      }
    }
    if (reasons.empty()) {
      continue;
    }

    const bool alternative_online = std::any_of(step->alternative_component_ids().begin(), step->alternative_component_ids().end(),
                                                [&](const std::string& id) { return index_.IsOnline(id); });

    AffectedStep affected;
    affected.set_workflow_id(workflow.id());
    affected.set_workflow_name(workflow.name());
    affected.set_step_id(step->id());
    affected.set_step_name(step->name());
    affected.set_order(step->order());
    for (auto& id : reasons) {
      affected.add_reason_component_ids(std::move(id));
    }
    affected.set_severity(alternative_online ? STEP_SEVERITY_DEGRADED : STEP_SEVERITY_FAILED);
    result.push_back(std::move(affected));
  }

  return result;
}

std::vector<AffectedStep> WorkflowImpactMapper::ImpactedSteps(const Workflows& workflows) const {
  std::vector<AffectedStep> result;
  for (const auto& workflow : workflows) {
    auto steps = ImpactedSteps(workflow);
    std::move(steps.begin(), steps.end(), std::back_inserter(result));
  }
  return result;
}

std::vector<AffectedWorkflow> WorkflowImpactMapper::AffectedWorkflows(const Workflows& workflows, StepView view) const {
  std::vector<AffectedWorkflow> result;

  for (const auto& workflow : workflows) {
    const auto steps = ImpactedSteps(workflow);
    if (steps.empty()) {
      continue;
    }

    AffectedWorkflow affected;
    affected.set_workflow_id(workflow.id());
    affected.set_name(workflow.name());
    affected.set_criticality(workflow.criticality());
    affected.set_impacted_step_count(static_cast<uint32_t>(steps.size()));

    std::vector<std::string> impacted_ids;
    for (const auto& step : steps) {
      impacted_ids.push_back(step.step_id());
      affected.add_impacted_step_ids(step.step_id());
    }
    for (const auto* step : ReduceSteps(workflow, impacted_ids, view)) {
      affected.add_visible_step_ids(step->id());
    }

    result.push_back(std::move(affected));
  }

  std::stable_sort(result.begin(), result.end(), [](const AffectedWorkflow& a, const AffectedWorkflow& b) {
    if (a.criticality() != b.criticality()) {
      return a.criticality() > b.criticality();
    }
    if (a.impacted_step_count() != b.impacted_step_count()) {
      return a.impacted_step_count() > b.impacted_step_count();
    }
    return a.workflow_id() < b.workflow_id();
  });

  return result;
}

std::vector<const WorkflowStep*> ReduceSteps(const BusinessWorkflow& workflow, const std::vector<std::string>& impacted_step_ids, StepView view) {
  const auto                            steps = SortedSteps(workflow);
  const std::unordered_set<std::string> impacted(impacted_step_ids.begin(), impacted_step_ids.end());

  std::vector<bool> keep(steps.size(), false);
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (!impacted.contains(steps[i]->id())) {
      continue;
    }
    keep[i] = true;
    if (view == StepView::kImpactedWithNeighbors) {
      if (i > 0) keep[i - 1] = true;
      if (i + 1 < steps.size()) keep[i + 1] = true;
    }
  }

  std::vector<const WorkflowStep*> reduced;
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (keep[i]) {
      reduced.push_back(steps[i]);
    }
  }
  return reduced;
}

graph::NodeSet ImpactedOrOffline(const graph::NodeSet& impacted, const Components& components) {
  graph::NodeSet result = impacted;
  for (const auto& component : components) {
    if (component.status() == COMPONENT_STATUS_OFFLINE) {
      result.insert(component.id());
    }
  }
  return result;
}

} // namespace impact::workflow

#pragma once

#include <string>
#include <vector>

#include "internal/graph/adjacency.hpp"
#include "internal/graph/component_index.hpp"

namespace impact::workflow {

enum class StepView {
  kImpactedOnly,
  // Impacted steps plus their immediate predecessor and successor.
  kImpactedWithNeighbors,
};

// Steps ordered by `order` ascending; equal orders keep declaration order.
std::vector<const impact::v1::WorkflowStep*> SortedSteps(const impact::v1::BusinessWorkflow& workflow);

// Legacy single reference merged with the multi-id list, deduplicated.
std::vector<std::string> StepComponentIds(const impact::v1::WorkflowStep& step);

/*
  Maps a set of affected component ids onto workflow steps.

  `affected` must already contain the offline roots as well as the
  downstream-impacted nodes: a step that references an offline component
  directly is impacted too.
*/
class WorkflowImpactMapper {
 public:
  WorkflowImpactMapper(const graph::ComponentIndex& index, graph::NodeSet affected);

  // Impacted steps of one workflow, in step order.
  std::vector<impact::v1::AffectedStep> ImpactedSteps(const impact::v1::BusinessWorkflow& workflow) const;

  std::vector<impact::v1::AffectedStep> ImpactedSteps(const impact::v1::Workflows& workflows) const;

  /*
    Affected workflows, most severe first: criticality descending, then
    impacted step count descending, then workflow id.
  */
  std::vector<impact::v1::AffectedWorkflow> AffectedWorkflows(const impact::v1::Workflows& workflows,
                                                              StepView view = StepView::kImpactedOnly) const;

 private:
  const graph::ComponentIndex& index_;
  graph::NodeSet               affected_;
};

// Display reduction; never drops an impacted step.
std::vector<const impact::v1::WorkflowStep*> ReduceSteps(const impact::v1::BusinessWorkflow& workflow,
                                                         const std::vector<std::string>& impacted_step_ids, StepView view);

// Offline roots joined with the impacted set, for step membership tests.
graph::NodeSet ImpactedOrOffline(const graph::NodeSet& impacted, const impact::v1::Components& components);

} // namespace impact::workflow

#pragma once

#include "impact/v1.hpp"
#include "internal/analysis/impact_analyzer.hpp"
#include "internal/graph/adjacency.hpp"
#include "internal/workflow/workflow_impact.hpp"
#include "service_context.hpp"

namespace impact::service {

/*
  Entry points used by impactctl.

  Every call acquires one snapshot from the inventory source, validates
  it, and runs the pure analysis functions on it. Nothing is cached
  between calls.
*/
class AnalysisService {
public:
  explicit AnalysisService(ServiceContext ctx);

  // Offline roots and everything downstream of them; visible_ids restricts
  // the graph to a subset of nodes.
  impact::v1::DownstreamReport Downstream(const graph::NodeSet* visible_ids = nullptr);

  impact::v1::CauseReport Causes();

  impact::v1::WorkflowImpactReport Workflows(workflow::StepView view = workflow::StepView::kImpactedOnly);

  impact::v1::AnalysisReport Analyze(const analysis::AnalysisScope& scope);

  impact::v1::ValidationReport Validate();

private:
  impact::v1::InventorySnapshot AcquireSnapshot();

  ServiceContext ctx_;
};

}

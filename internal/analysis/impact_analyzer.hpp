#pragma once

#include <string>
#include <utility>
#include <vector>

#include "impact/v1.hpp"
#include "internal/scoring/impact_scorer.hpp"

namespace impact::analysis {

struct AnalysisScope {
  enum class Kind {
    kComponent,
    kAllComponents,
    // Every component whose status is not online.
    kNonOnline,
  };

  Kind        kind = Kind::kNonOnline;
  std::string component_id;

  static AnalysisScope Component(std::string id) {
    return {Kind::kComponent, std::move(id)};
  }
  static AnalysisScope All() {
    return {Kind::kAllComponents, {}};
  }
  static AnalysisScope NonOnline() {
    return {Kind::kNonOnline, {}};
  }

  // "all", "non-online", or anything else as a component id.
  static AnalysisScope Parse(const std::string& value);
};

/*
  Per-component "what if this goes down" analysis.

  Walks forward adjacency from the analyzed component. Direct impacts are
  its distinct immediate successors, indirect impacts everything else that
  is reachable. Workflow steps referencing the component itself or any
  reachable node are affected.

  Stateless apart from the scoring policy; safe to share across threads.
*/
class ImpactAnalyzer {
 public:
  explicit ImpactAnalyzer(scoring::ImpactScorer scorer = scoring::ImpactScorer{});

  impact::v1::AnalysisResult Analyze(const std::string& component_id, const impact::v1::Components& components,
                                     const impact::v1::Dependencies& dependencies, const impact::v1::Workflows& workflows) const;

  // Results for the scope, highest score first (ties by component id).
  std::vector<impact::v1::AnalysisResult> ComputeAnalysisResults(const impact::v1::Components& components,
                                                                 const impact::v1::Dependencies& dependencies,
                                                                 const impact::v1::Workflows& workflows, const AnalysisScope& scope) const;

  const scoring::ImpactScorer& scorer() const {
    return scorer_;
  }

 private:
  scoring::ImpactScorer scorer_;
};

} // namespace impact::analysis

#include "internal/scoring/impact_scorer.hpp"

#include <cmath>

namespace impact::scoring {

using namespace impact::v1;

ImpactScorer::ImpactScorer(ScoringPolicy policy) : policy_(policy) {
  ValidatePolicy(policy_);
}

std::int64_t ImpactScorer::Score(const ImpactProfile& profile) const {
  const auto direct   = static_cast<double>(profile.direct_count);
  const auto indirect = static_cast<double>(profile.indirect_count);

  double workflow_score = 0.0;
  for (const auto criticality : profile.affected_workflows) {
    workflow_score += policy_.workflow_weight.At(criticality);
  }

  const double raw = direct * policy_.direct_weight + indirect * policy_.indirect_weight + workflow_score +
                     static_cast<double>(profile.failed_step_count) * policy_.failed_step_weight +
                     static_cast<double>(profile.max_depth) * policy_.depth_weight + (direct + indirect) * policy_.breadth_weight;

  return std::llround(raw * policy_.criticality_multiplier.At(profile.criticality));
}

RiskLevel ImpactScorer::Classify(std::int64_t score) const {
  const auto  value = static_cast<double>(score);
  const auto& t     = policy_.thresholds;

  if (value >= t.critical) return RISK_LEVEL_CRITICAL;
  if (value >= t.high) return RISK_LEVEL_HIGH;
  if (value >= t.medium) return RISK_LEVEL_MEDIUM;
  return RISK_LEVEL_LOW;
}

} // namespace impact::scoring

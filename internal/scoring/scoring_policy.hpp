#pragma once

#include "impact/v1/types.pb.h"

namespace impact::scoring {

/*
  Default scoring weights and risk thresholds.

  score = round(multiplier(own criticality) * (
              direct * kDirectImpactWeight
            + indirect * kIndirectImpactWeight
            + sum over affected workflows of workflow_weight(criticality)
            + failed steps * kFailedStepWeight
            + max hop depth * kDepthWeight
            + (direct + indirect) * kBreadthWeight))

  risk = critical if score >= kCriticalRiskThreshold,
         high     if score >= kHighRiskThreshold,
         medium   if score >= kMediumRiskThreshold,
         low      otherwise.
*/
inline constexpr double kDirectImpactWeight   = 12.0;
inline constexpr double kIndirectImpactWeight = 8.0;
inline constexpr double kFailedStepWeight     = 5.0;
inline constexpr double kDepthWeight          = 3.0;
inline constexpr double kBreadthWeight        = 2.0;

inline constexpr double kLowWorkflowWeight      = 15.0;
inline constexpr double kMediumWorkflowWeight   = 20.0;
inline constexpr double kHighWorkflowWeight     = 25.0;
inline constexpr double kCriticalWorkflowWeight = 30.0;

inline constexpr double kLowMultiplier      = 1.0;
inline constexpr double kMediumMultiplier   = 1.0;
inline constexpr double kHighMultiplier     = 1.5;
inline constexpr double kCriticalMultiplier = 2.0;

inline constexpr double kMediumRiskThreshold   = 45.0;
inline constexpr double kHighRiskThreshold     = 90.0;
inline constexpr double kCriticalRiskThreshold = 150.0;

struct CriticalityTable {
  double low      = 0.0;
  double medium   = 0.0;
  double high     = 0.0;
  double critical = 0.0;

  // Unspecified criticality is scored as low.
  double At(impact::v1::Criticality criticality) const;
};

struct RiskThresholds {
  double medium   = kMediumRiskThreshold;
  double high     = kHighRiskThreshold;
  double critical = kCriticalRiskThreshold;
};

struct ScoringPolicy {
  double direct_weight      = kDirectImpactWeight;
  double indirect_weight    = kIndirectImpactWeight;
  double failed_step_weight = kFailedStepWeight;
  double depth_weight       = kDepthWeight;
  double breadth_weight     = kBreadthWeight;

  CriticalityTable workflow_weight{kLowWorkflowWeight, kMediumWorkflowWeight, kHighWorkflowWeight, kCriticalWorkflowWeight};
  CriticalityTable criticality_multiplier{kLowMultiplier, kMediumMultiplier, kHighMultiplier, kCriticalMultiplier};
  RiskThresholds   thresholds;
};

/*
  Rejects a policy that would break monotonicity: NaN or infinite values,
  negative weights, per-criticality tables that decrease with criticality, a multiplier
  below zero, or thresholds that are not strictly increasing.

  Throws util::InvalidConfig.
*/
void ValidatePolicy(const ScoringPolicy& policy);

} // namespace impact::scoring

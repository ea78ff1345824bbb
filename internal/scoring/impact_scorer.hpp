#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/scoring/scoring_policy.hpp"

namespace impact::scoring {

// Everything the score depends on for one analyzed component.
struct ImpactProfile {
  std::size_t   direct_count      = 0;
  std::size_t   indirect_count    = 0;
  std::uint32_t max_depth         = 0;
  std::size_t   failed_step_count = 0;

  std::vector<impact::v1::Criticality> affected_workflows;

  impact::v1::Criticality criticality = impact::v1::CRITICALITY_LOW;
};

/*
  Deterministic rule-based scorer. Non-decreasing in every field of
  ImpactProfile for any policy accepted by ValidatePolicy.
*/
class ImpactScorer {
 public:
  // Throws util::InvalidConfig for a policy ValidatePolicy rejects.
  explicit ImpactScorer(ScoringPolicy policy = {});

  std::int64_t Score(const ImpactProfile& profile) const;

  impact::v1::RiskLevel Classify(std::int64_t score) const;

  const ScoringPolicy& policy() const {
    return policy_;
  }

 private:
  ScoringPolicy policy_;
};

} // namespace impact::scoring

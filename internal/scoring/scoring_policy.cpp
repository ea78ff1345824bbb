#include "internal/scoring/scoring_policy.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace impact::scoring {

using namespace impact::v1;

double CriticalityTable::At(Criticality criticality) const {
  switch (criticality) {
    case CRITICALITY_CRITICAL:
      return critical;
    case CRITICALITY_HIGH:
      return high;
    case CRITICALITY_MEDIUM:
      return medium;
    case CRITICALITY_LOW:
    default:
      return low;
  }
}

namespace {

void RequireFinite(double value, const std::string& name) {
  if (!std::isfinite(value)) {
    throw util::InvalidConfig("scoring." + name + " must be a finite number");
  }
}

void RequireNonNegative(double value, const std::string& name) {
  RequireFinite(value, name);
  if (value < 0.0) {
    throw util::InvalidConfig("scoring." + name + " must not be negative");
  }
}

void RequireNonDecreasing(const CriticalityTable& table, const std::string& name) {
  RequireNonNegative(table.low, name + ".low");
  RequireNonNegative(table.medium, name + ".medium");
  RequireNonNegative(table.high, name + ".high");
  RequireNonNegative(table.critical, name + ".critical");
  if (table.medium < table.low || table.high < table.medium || table.critical < table.high) {
    throw util::InvalidConfig("scoring." + name + " must not decrease from low to critical");
  }
}

} // namespace

void ValidatePolicy(const ScoringPolicy& policy) {
  RequireNonNegative(policy.direct_weight, "direct_weight");
  RequireNonNegative(policy.indirect_weight, "indirect_weight");
  RequireNonNegative(policy.failed_step_weight, "failed_step_weight");
  RequireNonNegative(policy.depth_weight, "depth_weight");
  RequireNonNegative(policy.breadth_weight, "breadth_weight");

  RequireNonDecreasing(policy.workflow_weight, "workflow_weight");
  RequireNonDecreasing(policy.criticality_multiplier, "criticality_multiplier");

  const auto& t = policy.thresholds;
  RequireFinite(t.medium, "thresholds.medium");
  RequireFinite(t.high, "thresholds.high");
  RequireFinite(t.critical, "thresholds.critical");
  if (!(0.0 < t.medium && t.medium < t.high && t.high < t.critical)) {
    throw util::InvalidConfig("scoring.thresholds must satisfy 0 < medium < high < critical");
  }
}

} // namespace impact::scoring

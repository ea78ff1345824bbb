#pragma once

#include <string_view>

#include "impact/v1/types.pb.h"

namespace impact::model {

constexpr std::string_view ToString(impact::v1::ComponentType type) {
  switch (type) {
    case impact::v1::COMPONENT_TYPE_SERVER:
      return "server";
    case impact::v1::COMPONENT_TYPE_DATABASE:
      return "database";
    case impact::v1::COMPONENT_TYPE_API:
      return "api";
    case impact::v1::COMPONENT_TYPE_LOAD_BALANCER:
      return "load-balancer";
    case impact::v1::COMPONENT_TYPE_NETWORK:
      return "network";
    case impact::v1::COMPONENT_TYPE_APPLICATION:
      return "application";
    case impact::v1::COMPONENT_TYPE_SERVICE:
      return "service";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(impact::v1::ComponentStatus status) {
  switch (status) {
    case impact::v1::COMPONENT_STATUS_ONLINE:
      return "online";
    case impact::v1::COMPONENT_STATUS_OFFLINE:
      return "offline";
    case impact::v1::COMPONENT_STATUS_WARNING:
      return "warning";
    case impact::v1::COMPONENT_STATUS_MAINTENANCE:
      return "maintenance";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(impact::v1::Criticality criticality) {
  switch (criticality) {
    case impact::v1::CRITICALITY_LOW:
      return "low";
    case impact::v1::CRITICALITY_MEDIUM:
      return "medium";
    case impact::v1::CRITICALITY_HIGH:
      return "high";
    case impact::v1::CRITICALITY_CRITICAL:
      return "critical";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(impact::v1::DependencyType type) {
  switch (type) {
    case impact::v1::DEPENDENCY_TYPE_REQUIRES:
      return "requires";
    case impact::v1::DEPENDENCY_TYPE_USES:
      return "uses";
    case impact::v1::DEPENDENCY_TYPE_FEEDS:
      return "feeds";
    case impact::v1::DEPENDENCY_TYPE_MONITORS:
      return "monitors";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(impact::v1::RiskLevel level) {
  switch (level) {
    case impact::v1::RISK_LEVEL_LOW:
      return "low";
    case impact::v1::RISK_LEVEL_MEDIUM:
      return "medium";
    case impact::v1::RISK_LEVEL_HIGH:
      return "high";
    case impact::v1::RISK_LEVEL_CRITICAL:
      return "critical";
    default:
      return "unspecified";
  }
}

} // namespace impact::model

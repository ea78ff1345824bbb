#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/analysis/impact_analyzer.hpp"
#include "internal/service/analysis_service.hpp"

namespace impact::factory {

/*
  Application

  Everything the command line needs for one invocation.
*/
struct Application {
  std::shared_ptr<service::AnalysisService> service;
  analysis::AnalysisScope                   default_scope;
};

/*
  Build

  Composition root: the only place that picks the concrete inventory
  source and turns config into a scoring policy.
*/
Application Build(const impact::runtime::config::RuntimeConfig& config, const std::string& snapshot_path);

} // namespace impact::factory

#pragma once

#include <memory>

namespace impact::inventory { class InventorySource; }
namespace impact::analysis { class ImpactAnalyzer; }

namespace impact::service {

/*
  Dependency container for the analysis service.
*/
struct ServiceContext {
  std::shared_ptr<impact::inventory::InventorySource> source;
  std::shared_ptr<impact::analysis::ImpactAnalyzer> analyzer;
};

}

#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using impact::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  impactctl [--config <config.yaml>] <snapshot.(json|yaml)> <command>\n"
            << "\n"
            << "Commands:\n"
            << "  downstream [--visible <id,id,...>]   offline roots and their downstream impact\n"
            << "  causes                               nearest offline root per impacted component\n"
            << "  workflows [--neighbors]              affected workflows and impacted steps\n"
            << "  analyze [all|non-online|<id>]        business impact score and risk level\n"
            << "  validate                             cycles, single points of failure, edge issues\n";
}

static impact::graph::NodeSet SplitIds(const std::string& csv) {
  impact::graph::NodeSet ids;
  std::stringstream      in(csv);
  std::string            id;
  while (std::getline(in, id, ',')) {
    if (!id.empty()) {
      ids.insert(id);
    }
  }
  return ids;
}

static int Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << status.message() << "\n";
    return 2;
  }
  std::cout << json;
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string snapshot_path = args[0];
  const std::string cmd           = args[1];

  impact::runtime::config::RuntimeConfig config;
  try {
    if (!config_path.empty()) {
      config = impact::config::ConfigLoader::LoadFromYaml(config_path);
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  impact::observability::InitializeLogging(config);

  try {
    auto app = impact::factory::Build(config, snapshot_path);

    int rc = 0;

    // ------------------------------------------------------------

    if (cmd == "downstream") {
      if (args.size() >= 4 && args[2] == "--visible") {
        const auto visible = SplitIds(args[3]);
        rc                 = Print(app.service->Downstream(&visible));
      } else if (args.size() == 2) {
        rc = Print(app.service->Downstream());
      } else {
        Usage();
        rc = 1;
      }
    }

    // ------------------------------------------------------------

    else if (cmd == "causes") {
      rc = Print(app.service->Causes());
    }

    // ------------------------------------------------------------

    else if (cmd == "workflows") {
      const bool neighbors = args.size() >= 3 && args[2] == "--neighbors";
      rc = Print(app.service->Workflows(neighbors ? impact::workflow::StepView::kImpactedWithNeighbors : impact::workflow::StepView::kImpactedOnly));
    }

    // ------------------------------------------------------------

    else if (cmd == "analyze") {
      const auto scope = args.size() >= 3 ? impact::analysis::AnalysisScope::Parse(args[2]) : app.default_scope;
      rc               = Print(app.service->Analyze(scope));
    }

    // ------------------------------------------------------------

    else if (cmd == "validate") {
      rc = Print(app.service->Validate());
    }

    else {
      Usage();
      rc = 1;
    }

    impact::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    IMPACT_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    impact::observability::ShutdownLogging();
    return 2;
  }
}

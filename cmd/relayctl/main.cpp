#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "relay/spec/v1.hpp"

using namespace relay::spec::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl [--config <config.yaml>] [--check-references] <pipeline.yaml>\n";
}

static void PrintSpec(const PipelineSpec& spec) {
  std::cout << "pipeline " << (spec.name.empty() ? "<unnamed>" : spec.name);
  if (spec.version) std::cout << " v" << *spec.version;
  std::cout << " (" << spec.steps.size() << " steps)\n";

  for (const auto& step : spec.steps) {
    std::cout << "  " << step.id << " [" << ToString(step.type) << "]";
    for (std::size_t i = 0; i < step.inputs.size(); ++i) {
      std::cout << (i == 0 ? " <- " : ", ") << step.input_names[i] << "=" << step.inputs[i].ToString();
    }
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string spec_path;
  bool        check_references = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--check-references") {
      check_references = true;
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else if (spec_path.empty() && arg.rfind("--", 0) != 0) {
      spec_path = arg;
    } else {
      Usage();
      return 1;
    }
  }

  if (spec_path.empty()) {
    Usage();
    return 1;
  }

  relay::runtime::config::RuntimeConfig config;
  try {
    if (!config_path.empty()) config = relay::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  relay::observability::InitializeLogging(config);

  LoadOptions options;
  options.check_references = check_references || config.loader().check_references();

  try {
    const auto spec = LoadPipelineSpecFile(spec_path, options);
    PrintSpec(spec);
  } catch (const SpecError& e) {
    std::cerr << e.what() << "\n";
    relay::observability::ShutdownLogging();
    return 2;
  }

  relay::observability::ShutdownLogging();
  return 0;
}

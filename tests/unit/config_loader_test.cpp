#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestLoadsLoggingAndLoaderSections() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
loader:
  check_references: true
)");

  auto config = relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.loader().check_references());
}

void TestMissingSectionsDefault() {
  auto config = relay::config::ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n");
  assert(config.logging().level() == "warn");
  assert(config.logging().pattern().empty());
  assert(!config.loader().check_references());

  auto empty = relay::config::ConfigLoader::LoadFromYamlString("");
  assert(empty.logging().level().empty());
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = relay::config::ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "line1\nline2☃"
)");
  assert(config.logging().pattern() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: info
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)relay::config::ConfigLoader::LoadFromYaml("/nonexistent/relay/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config: ") == 0;
  }

  assert(threw);
}

} // namespace

int main() {
  TestLoadsLoggingAndLoaderSections();
  TestMissingSectionsDefault();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "relay_unit_config_loader: pass\n";
  return 0;
}

#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"

namespace {

using relay::observability::BoolField;
using relay::observability::IntField;
using relay::observability::StringField;

void TestConfigLevelIsApplied() {
  unsetenv("RELAY_LOG_LEVEL");

  relay::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  relay::observability::InitializeLogging(config);

  assert(spdlog::default_logger()->level() == spdlog::level::warn);
  assert(!spdlog::should_log(spdlog::level::info));
}

void TestEnvironmentOverridesConfig() {
  setenv("RELAY_LOG_LEVEL", "debug", 1);

  relay::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("error");
  relay::observability::InitializeLogging(config);

  assert(spdlog::default_logger()->level() == spdlog::level::debug);
  unsetenv("RELAY_LOG_LEVEL");
}

void TestFieldsSerialize() {
  assert(StringField("step_id", "a").value == "a");
  assert(IntField("steps", 3).value == "3");
  assert(BoolField("ok", false).value == "false");

  RELAY_LOG_INFO("fields", {StringField("step_id", "a"), IntField("steps", 3)});
  RELAY_LOG_WARN("no fields");
}

} // namespace

int main() {
  TestConfigLevelIsApplied();
  TestEnvironmentOverridesConfig();
  TestFieldsSerialize();
  relay::observability::ShutdownLogging();

  std::cout << "relay_unit_logging: pass\n";
  return 0;
}

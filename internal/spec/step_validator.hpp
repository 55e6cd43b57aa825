#pragma once

#include <string>
#include <unordered_set>

#include "internal/document/value.hpp"
#include "internal/spec/model.hpp"

namespace relay::spec {

using SeenStepIds = std::unordered_set<std::string>;

/*
  Validates one entry of the `steps` sequence.

  Checks run in document field order (shape, id, type, inputs,
  config) and the first failure throws util::SpecError. The id is
  recorded in `seen_ids` as soon as it passes, before later fields
  are looked at, so a step that fails on `type` still claims its id.
*/
StepSpec ValidateStep(const document::Value& node, SeenStepIds& seen_ids);

} // namespace relay::spec

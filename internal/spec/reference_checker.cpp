#include "reference_checker.hpp"

#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace relay::spec {

void CheckReferences(const PipelineSpec& spec) {
  std::unordered_set<std::string> ids;
  for (const auto& step : spec.steps) ids.insert(step.id);

  for (const auto& step : spec.steps) {
    for (std::size_t i = 0; i < step.inputs.size(); ++i) {
      const auto& ref = step.inputs[i];
      if (ids.count(ref.step_id)) continue;

      const std::string input = i < step.input_names.size() ? step.input_names[i] : std::to_string(i);
      throw util::SpecError("Step " + step.id + ", input " + util::Quote(input) + ": references unknown step " +
                            util::Quote(ref.step_id) + ".");
    }
  }
}

} // namespace relay::spec

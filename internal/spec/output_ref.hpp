#pragma once

#include <string_view>

#include "internal/document/value.hpp"
#include "internal/spec/model.hpp"

namespace relay::spec {

/*
  Parses "step_id.output_name".

  The split is at the LAST '.', so step ids may be dotted
  ("ns.sub.out" -> step "ns.sub", output "out"). Both halves are
  trimmed and must be non-empty. Throws util::SpecError.
*/
OutputRef ParseOutputRefText(std::string_view text);

// Rejects non-string nodes, naming the kind found.
OutputRef ParseOutputRef(const document::Value& node);

} // namespace relay::spec

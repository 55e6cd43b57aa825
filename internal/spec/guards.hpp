#pragma once

#include <string>

#include "internal/document/value.hpp"

namespace relay::spec {

/*
  Structural guards.

  The single place where a node's kind is checked before field
  access. A mismatch (null included) throws util::SpecError with
  `message` verbatim.
*/

const document::Mapping&  ExpectMapping(const document::Value* node, const std::string& message);
const document::Sequence& ExpectSequence(const document::Value* node, const std::string& message);

inline const document::Mapping& ExpectMapping(const document::Value& node, const std::string& message) {
  return ExpectMapping(&node, message);
}

inline const document::Sequence& ExpectSequence(const document::Value& node, const std::string& message) {
  return ExpectSequence(&node, message);
}

} // namespace relay::spec

#pragma once

#include "internal/document/value.hpp"

namespace relay::document {

/*
  DocumentSource

  Produces the root node of one document. Implementations own the
  raw text and its decoding; they throw util::DecodeError when the
  text is not a well-formed document.

  Load() must be reentrant: the spec loader may be called from
  several threads against distinct sources.
*/
class DocumentSource {
 public:
  virtual ~DocumentSource() = default;

  virtual Value Load() const = 0;

  // Human readable origin used in log lines ("<string>" or a path).
  virtual std::string Describe() const = 0;
};

} // namespace relay::document

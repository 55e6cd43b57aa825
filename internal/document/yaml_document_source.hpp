#pragma once

#include <filesystem>
#include <string>

#include "internal/document/document_source.hpp"

namespace YAML {
class Node;
}

namespace relay::document {

/*
  YAML backed document sources.

  Plain scalars are resolved with the YAML 1.2 core schema; quoted
  scalars always decode as strings.
*/

Value FromYaml(const YAML::Node& node);

class YamlFileSource : public DocumentSource {
 public:
  explicit YamlFileSource(std::filesystem::path path);

  Value       Load() const override;
  std::string Describe() const override;

 private:
  std::filesystem::path path_;
};

class YamlStringSource : public DocumentSource {
 public:
  explicit YamlStringSource(std::string text);

  Value       Load() const override;
  std::string Describe() const override;

 private:
  std::string text_;
};

} // namespace relay::document

#include "yaml_document_source.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace relay::document {
namespace {

constexpr int kMaxDepth = 256;

bool IsDigits(std::string_view s, int base) {
  if (s.empty()) return false;
  for (char c : s) {
    const bool ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c)) != 0
                    : base == 8 ? (c >= '0' && c <= '7')
                                : std::isdigit(static_cast<unsigned char>(c)) != 0;
    if (!ok) return false;
  }
  return true;
}

bool IsNullScalar(std::string_view s) {
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> ResolveBool(std::string_view s) {
  if (s == "true" || s == "True" || s == "TRUE") return true;
  if (s == "false" || s == "False" || s == "FALSE") return false;
  return std::nullopt;
}

std::optional<std::int64_t> ResolveInt(std::string_view s) {
  int base = 10;
  if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
    base = 16;
    s.remove_prefix(2);
  } else if (s.size() > 2 && s[0] == '0' && s[1] == 'o') {
    base = 8;
    s.remove_prefix(2);
  }

  std::string_view digits = s;
  if (base == 10 && !digits.empty() && (digits[0] == '-' || digits[0] == '+')) digits.remove_prefix(1);
  if (!IsDigits(digits, base)) return std::nullopt;

  // from_chars rejects a leading '+'.
  if (base == 10 && s[0] == '+') s.remove_prefix(1);

  std::int64_t value = 0;
  auto [ptr, ec]     = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

std::optional<double> ResolveFloat(std::string_view s) {
  std::string_view body     = s;
  bool             negative = false;
  if (!body.empty() && (body[0] == '-' || body[0] == '+')) {
    negative = body[0] == '-';
    body.remove_prefix(1);
  }

  if (body == ".inf" || body == ".Inf" || body == ".INF") {
    return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
  }
  if (s == ".nan" || s == ".NaN" || s == ".NAN") {
    return std::numeric_limits<double>::quiet_NaN();
  }

  // [0-9]* ( . [0-9]* )? ( [eE] [-+]? [0-9]+ )? with at least one mantissa digit
  std::size_t i              = 0;
  bool        mantissa_digit = false;
  while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
    ++i;
    mantissa_digit = true;
  }
  if (i < body.size() && body[i] == '.') {
    ++i;
    while (i < body.size() && std::isdigit(static_cast<unsigned char>(body[i]))) {
      ++i;
      mantissa_digit = true;
    }
  }
  if (!mantissa_digit) return std::nullopt;
  if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
    ++i;
    if (i < body.size() && (body[i] == '-' || body[i] == '+')) ++i;
    if (!IsDigits(body.substr(i), 10)) return std::nullopt;
    i = body.size();
  }
  if (i != body.size()) return std::nullopt;

  const std::string text(s);
  char*             endptr = nullptr;
  const double      value  = std::strtod(text.c_str(), &endptr);
  if (!endptr || *endptr != '\0') return std::nullopt;
  return value;
}

Value ResolveScalar(const YAML::Node& node) {
  const std::string& scalar = node.Scalar();
  const std::string& tag    = node.Tag();

  // "!" marks a quoted scalar.
  if (tag == "!" || tag == "tag:yaml.org,2002:str") {
    return Value(scalar);
  }

  if (IsNullScalar(scalar)) return Value(nullptr);
  if (auto b = ResolveBool(scalar)) return Value(*b);
  if (auto i = ResolveInt(scalar)) return Value(*i);
  if (auto f = ResolveFloat(scalar)) return Value(*f);
  return Value(scalar);
}

// "<<" plain key, as in `<<: *base` or `<<: [*a, *b]`.
bool IsMergeKey(const YAML::Node& key) {
  return key.Scalar() == "<<" && key.Tag() != "!";
}

void MergeEntries(Mapping& target, const Mapping& source) {
  for (const auto& [key, value] : source) {
    // Insert keeps an existing key untouched.
    target.Insert(key, value);
  }
}

// A merge value is a mapping or a sequence of mappings; earlier
// mappings in the sequence take precedence.
void MergeInto(Mapping& target, const Value& merge, int line) {
  if (const auto* source = merge.AsMapping()) {
    MergeEntries(target, *source);
    return;
  }
  if (const auto* sources = merge.AsSequence()) {
    for (const auto& item : *sources) {
      const auto* source = item.AsMapping();
      if (!source) {
        throw util::DecodeError("merge key '<<' sequence entries must be mappings (line " + std::to_string(line) + ")");
      }
      MergeEntries(target, *source);
    }
    return;
  }
  throw util::DecodeError("merge key '<<' must reference a mapping or a list of mappings (line " + std::to_string(line) + ")");
}

Value Convert(const YAML::Node& node, int depth) {
  if (depth > kMaxDepth) {
    throw util::DecodeError("document nesting exceeds " + std::to_string(kMaxDepth) + " levels");
  }

  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value(nullptr);

    case YAML::NodeType::Scalar:
      return ResolveScalar(node);

    case YAML::NodeType::Sequence: {
      Sequence sequence;
      sequence.reserve(node.size());
      for (const auto& item : node) {
        sequence.push_back(Convert(item, depth + 1));
      }
      return Value(std::move(sequence));
    }

    case YAML::NodeType::Map: {
      Mapping                 mapping;
      std::vector<YAML::Node> merges;
      for (auto it : node) {
        if (!it.first.IsScalar()) {
          throw util::DecodeError("mapping keys must be scalars (line " + std::to_string(it.first.Mark().line + 1) + ")");
        }
        if (IsMergeKey(it.first)) {
          merges.push_back(it.second);
          continue;
        }
        const std::string key = it.first.Scalar();
        if (!mapping.Insert(key, Convert(it.second, depth + 1))) {
          throw util::DecodeError("duplicate mapping key '" + key + "' (line " + std::to_string(it.first.Mark().line + 1) + ")");
        }
      }
      // explicit keys win over merged ones
      for (const auto& merge : merges) {
        MergeInto(mapping, Convert(merge, depth + 1), merge.Mark().line + 1);
      }
      return Value(std::move(mapping));
    }
  }

  throw util::DecodeError("unsupported YAML node");
}

} // namespace

Value FromYaml(const YAML::Node& node) {
  return Convert(node, 0);
}

// ------------------------------------------------------------
// File source
// ------------------------------------------------------------

YamlFileSource::YamlFileSource(std::filesystem::path path) : path_(std::move(path)) {
}

Value YamlFileSource::Load() const {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path_.string());
  } catch (const YAML::Exception& e) {
    throw util::DecodeError(e.what());
  }
  return FromYaml(root);
}

std::string YamlFileSource::Describe() const {
  return path_.string();
}

// ------------------------------------------------------------
// String source
// ------------------------------------------------------------

YamlStringSource::YamlStringSource(std::string text) : text_(std::move(text)) {
}

Value YamlStringSource::Load() const {
  YAML::Node root;
  try {
    root = YAML::Load(text_);
  } catch (const YAML::Exception& e) {
    throw util::DecodeError(e.what());
  }
  return FromYaml(root);
}

std::string YamlStringSource::Describe() const {
  return "<string>";
}

} // namespace relay::document

#include "value.hpp"

#include <algorithm>
#include <array>
#include <charconv>

namespace relay::document {

std::string_view KindName(Kind kind) {
  switch (kind) {
    case Kind::kNull:
      return "null";
    case Kind::kBool:
      return "bool";
    case Kind::kInt:
      return "int";
    case Kind::kFloat:
      return "float";
    case Kind::kString:
      return "str";
    case Kind::kSequence:
      return "list";
    case Kind::kMapping:
      return "map";
    default:
      return "unknown";
  }
}

// ------------------------------------------------------------
// Mapping
// ------------------------------------------------------------

Mapping::Mapping()                                    = default;
Mapping::Mapping(const Mapping& other)                = default;
Mapping::Mapping(Mapping&& other) noexcept            = default;
Mapping& Mapping::operator=(const Mapping& other)     = default;
Mapping& Mapping::operator=(Mapping&& other) noexcept = default;
Mapping::~Mapping()                                   = default;

bool Mapping::Insert(std::string key, Value value) {
  if (Contains(key)) return false;
  entries_.emplace_back(std::move(key), std::move(value));
  return true;
}

const Value* Mapping::Find(std::string_view key) const {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) { return entry.first == key; });
  if (it == entries_.end()) return nullptr;
  return &it->second;
}

bool Mapping::Contains(std::string_view key) const {
  return Find(key) != nullptr;
}

std::size_t Mapping::size() const {
  return entries_.size();
}

bool Mapping::empty() const {
  return entries_.empty();
}

std::vector<Mapping::Entry>::const_iterator Mapping::begin() const {
  return entries_.begin();
}

std::vector<Mapping::Entry>::const_iterator Mapping::end() const {
  return entries_.end();
}

bool Mapping::operator==(const Mapping& other) const {
  return entries_ == other.entries_;
}

// ------------------------------------------------------------
// Value accessors
// ------------------------------------------------------------

const bool* Value::AsBool() const {
  return std::get_if<bool>(&data_);
}

const std::int64_t* Value::AsInt() const {
  return std::get_if<std::int64_t>(&data_);
}

const double* Value::AsFloat() const {
  return std::get_if<double>(&data_);
}

const std::string* Value::AsString() const {
  return std::get_if<std::string>(&data_);
}

const Sequence* Value::AsSequence() const {
  return std::get_if<Sequence>(&data_);
}

const Mapping* Value::AsMapping() const {
  return std::get_if<Mapping>(&data_);
}

std::string Value::ToDisplayString() const {
  switch (kind()) {
    case Kind::kNull:
      return "null";
    case Kind::kBool:
      return *AsBool() ? "true" : "false";
    case Kind::kInt:
      return std::to_string(*AsInt());
    case Kind::kFloat: {
      // shortest text that round-trips
      std::array<char, 32> buffer{};
      auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), *AsFloat());
      if (ec != std::errc()) return "float";
      return std::string(buffer.data(), ptr);
    }
    case Kind::kString:
      return *AsString();
    default:
      return std::string(KindName(kind()));
  }
}

} // namespace relay::document

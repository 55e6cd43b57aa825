#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace relay::document {

/*
  Generic document tree.

  Every document source decodes into this closed set of node kinds.
  Callers narrow a Value through the spec guards instead of
  inspecting the variant directly.
*/

class Value;

using Sequence = std::vector<Value>;

enum class Kind : std::uint8_t {
  kNull = 0,
  kBool,
  kInt,
  kFloat,
  kString,
  kSequence,
  kMapping,
};

std::string_view KindName(Kind kind);

/*
  Mapping

  Insertion ordered, keys unique. Lookups are linear; spec documents
  are small.
*/
class Mapping {
 public:
  using Entry = std::pair<std::string, Value>;

  Mapping();
  Mapping(const Mapping& other);
  Mapping(Mapping&& other) noexcept;
  Mapping& operator=(const Mapping& other);
  Mapping& operator=(Mapping&& other) noexcept;
  ~Mapping();

  // Returns false and leaves the mapping unchanged when key already exists.
  bool Insert(std::string key, Value value);

  const Value* Find(std::string_view key) const;
  bool         Contains(std::string_view key) const;

  std::size_t size() const;
  bool        empty() const;

  std::vector<Entry>::const_iterator begin() const;
  std::vector<Entry>::const_iterator end() const;

  bool operator==(const Mapping& other) const;

 private:
  std::vector<Entry> entries_;
};

class Value {
 public:
  using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Mapping>;

  Value() = default;
  Value(std::nullptr_t) {
  }
  Value(bool v) : data_(v) {
  }
  Value(std::int64_t v) : data_(v) {
  }
  Value(int v) : data_(static_cast<std::int64_t>(v)) {
  }
  Value(double v) : data_(v) {
  }
  Value(std::string v) : data_(std::move(v)) {
  }
  Value(const char* v) : data_(std::string(v)) {
  }
  Value(Sequence v) : data_(std::move(v)) {
  }
  Value(Mapping v) : data_(std::move(v)) {
  }

  Kind kind() const {
    return static_cast<Kind>(data_.index());
  }

  bool IsNull() const {
    return kind() == Kind::kNull;
  }

  const bool*         AsBool() const;
  const std::int64_t* AsInt() const;
  const double*       AsFloat() const;
  const std::string*  AsString() const;
  const Sequence*     AsSequence() const;
  const Mapping*      AsMapping() const;

  // Scalar rendering used in messages and summaries. Containers render
  // as their kind name.
  std::string ToDisplayString() const;

  bool operator==(const Value& other) const {
    return data_ == other.data_;
  }

 private:
  Storage data_;
};

} // namespace relay::document

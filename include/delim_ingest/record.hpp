#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace di {

// Column names, fixed once the header is known and then shared read-only.
using FieldList = std::shared_ptr<const std::vector<std::string>>;

inline FieldList make_field_list(std::vector<std::string> names) {
  return std::make_shared<const std::vector<std::string>>(std::move(names));
}

// One framed input record. Never mutated after the reader hands it out.
struct RawRecord {
  FieldList fields;
  std::vector<std::string> tokens;
  std::uint64_t index = 0;
};

enum class ValueKind { Int, Double, String };

struct Value {
  ValueKind kind = ValueKind::String;
  std::string raw;          // token exactly as read
  std::int64_t i = 0;
  double d = 0.0;

  static Value of_string(std::string s) { Value v; v.raw = std::move(s); return v; }
};

struct DocField {
  std::string name;
  Value value;
};

// Ordered (name, value) pairs; repeated names stay separate entries.
class Document {
public:
  void reserve(std::size_t n) { fields_.reserve(n); }
  void append(std::string name, Value v) { fields_.push_back(DocField{std::move(name), std::move(v)}); }

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }
  const DocField& operator[](std::size_t i) const { return fields_[i]; }

  // First value stored under `name`, or nullptr.
  const Value* find(std::string_view name) const {
    for (const auto& f : fields_) if (f.name == name) return &f.value;
    return nullptr;
  }

  std::vector<DocField>::const_iterator begin() const { return fields_.begin(); }
  std::vector<DocField>::const_iterator end() const { return fields_.end(); }

private:
  std::vector<DocField> fields_;
};

}

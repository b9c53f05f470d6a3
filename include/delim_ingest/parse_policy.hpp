#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace di {

struct Value;

struct ParsePolicy {
  // false -> every token is kept as a string
  bool infer_types = true;

  // Whole-token base-10 integer that fits in int64.
  std::optional<std::int64_t> parse_int(std::string_view s) const;

  // Numeric parse (fast_float in .cpp). Whole token, finite values only.
  std::optional<double> parse_number(std::string_view s) const;

  // int64, then double, else string. The raw token is always kept.
  Value infer(std::string_view token) const;
};

}

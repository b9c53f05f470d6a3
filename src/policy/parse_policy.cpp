#include "delim_ingest/parse_policy.hpp"
#include "delim_ingest/record.hpp"
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <fast_float/fast_float.h>

namespace di {

std::optional<std::int64_t> ParsePolicy::parse_int(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<double> ParsePolicy::parse_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  // "inf"/"nan" spellings stay strings
  if (!std::isfinite(out)) return std::nullopt;
  return out;
}

Value ParsePolicy::infer(std::string_view token) const {
  Value v = Value::of_string(std::string(token));
  if (!infer_types) return v;
  if (auto i = parse_int(token)) {
    v.kind = ValueKind::Int;
    v.i = *i;
  } else if (auto d = parse_number(token)) {
    v.kind = ValueKind::Double;
    v.d = *d;
  }
  return v;
}

}

#include "delim_ingest/field_rules.hpp"
#include <utility>

namespace di {

static bool fail(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

static bool is_dotted_prefix(const std::string& head, const std::string& full) {
  return full.size() > head.size() && full.compare(0, head.size(), head) == 0 &&
         full[head.size()] == '.';
}

bool validate_fields(const std::vector<std::string>& fields, std::string* err_out) {
  if (fields.empty()) return fail(err_out, "no fields specified");

  for (std::size_t i = 0; i < fields.size(); ++i) {
    const std::string& f = fields[i];
    if (f.empty())
      return fail(err_out, "field #" + std::to_string(i + 1) + " has an empty name");
    if (f.front() == '$') return fail(err_out, "field '" + f + "' cannot start with a '$'");
    if (f.front() == '.') return fail(err_out, "field '" + f + "' cannot start with a '.'");
    if (f.back() == '.')  return fail(err_out, "field '" + f + "' cannot end with a '.'");
    if (f.find("..") != std::string::npos)
      return fail(err_out, "field '" + f + "' cannot contain consecutive '.' characters");

    for (std::size_t j = i + 1; j < fields.size(); ++j) {
      const std::string& g = fields[j];
      if (f == g) return fail(err_out, "fields cannot be identical: '" + f + "' and '" + g + "'");
      if (is_dotted_prefix(f, g) || is_dotted_prefix(g, f))
        return fail(err_out, "incompatible fields found: '" + f + "' and '" + g + "'");
    }
  }
  return true;
}

std::vector<std::string> parse_field_list(std::string_view text) {
  std::vector<std::string> out;
  auto trim = [](std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
  };
  if (trim(text).empty()) return out;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = text.find(',', start);
    std::string_view piece = (pos == std::string_view::npos) ? text.substr(start)
                                                             : text.substr(start, pos - start);
    out.emplace_back(trim(piece));
    if (pos == std::string_view::npos) break;
    start = pos + 1;
  }
  return out;
}

std::string join_fields(const std::vector<std::string>& fields) {
  std::string out;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) out += ", ";
    out += fields[i];
  }
  return out;
}

}

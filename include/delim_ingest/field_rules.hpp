#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace di {

// Checks a field list before it is used as document keys:
//   - at least one field, none empty
//   - no leading '$', no leading/trailing '.', no ".."
//   - no two identical names, and no name that is a dotted prefix of
//     another ("a" with "a.b")
bool validate_fields(const std::vector<std::string>& fields, std::string* err_out = nullptr);

// Splits a comma separated --fields value, trimming surrounding blanks.
std::vector<std::string> parse_field_list(std::string_view text);

// Human readable "a, b, c" used in log lines.
std::string join_fields(const std::vector<std::string>& fields);

}

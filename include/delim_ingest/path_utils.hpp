#pragma once
#include <filesystem>
#include <string_view>

namespace di {

enum class FileFormat { CSV, TSV, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .tsv | .tab), case-insensitive.
FileFormat detect_format(std::string_view path);

// "csv" / "tsv" / "tab" -> format; anything else Unknown.
FileFormat parse_format(std::string_view name);

}

#include "delim_ingest/path_utils.hpp"
#include <cctype>
#include <string>
#include <system_error>

namespace di {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat parse_format(std::string_view name) {
  const std::string n = lower(name);
  if (n == "csv") return FileFormat::CSV;
  if (n == "tsv" || n == "tab") return FileFormat::TSV;
  return FileFormat::Unknown;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  if (ext.empty()) return FileFormat::Unknown;
  return parse_format(std::string_view(ext).substr(1));
}

}

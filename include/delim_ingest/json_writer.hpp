#pragma once
#include <cstdint>
#include <string>

namespace di {

class Document;

// Appends `doc` as one JSON object (no trailing newline). Int and Double
// values become JSON numbers, everything else a string.
void append_json(std::string& out, const Document& doc);
std::string to_json(const Document& doc);

struct RunSummary {
  std::uint64_t documents = 0;
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::string filename;
  std::string format;
  bool ordered = false;
  std::uint64_t workers = 0;

  bool ok = true;
  std::string error_kind;   // empty when ok
  std::string error;
  std::uint64_t error_record = 0;   // 1-based, 0 when not tied to a record
};

class RunJsonWriter {
public:
  // Serialize summary to a single-line JSON string.
  static std::string to_json(const RunSummary& s);
};

}

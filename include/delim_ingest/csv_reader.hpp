#pragma once
#include "delim_ingest/input_reader.hpp"

namespace di {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool trim_leading_space = true;  // drop blanks before each field
  ChunkReader::Config lines{};
};

// RFC 4180 style records: quoted fields may hold delimiters, doubled quotes
// and newlines. Blank lines are skipped; records may differ in width.
class CsvInputReader : public InputReader {
public:
  explicit CsvInputReader(ByteSource& src, CsvConfig cfg = {});

  const char* format_name() const noexcept override { return "csv"; }

protected:
  Frame read_tokens(std::vector<std::string>& tokens, std::string& err) override;

private:
  CsvConfig cfg_;
  std::string line_;
};

}

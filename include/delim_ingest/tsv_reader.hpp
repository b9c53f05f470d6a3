#pragma once
#include "delim_ingest/input_reader.hpp"

namespace di {

struct TsvConfig {
  char separator = '\t';
  ChunkReader::Config lines{};
};

// One record per line, tokens split on a literal separator with no quoting.
// Trailing '\r' is stripped; blank lines yield a single empty token.
class TsvInputReader : public InputReader {
public:
  explicit TsvInputReader(ByteSource& src, TsvConfig cfg = {});

  const char* format_name() const noexcept override { return "tsv"; }

protected:
  Frame read_tokens(std::vector<std::string>& tokens, std::string& err) override;

private:
  TsvConfig cfg_;
  std::string line_;
};

}

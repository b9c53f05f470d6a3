#include "delim_ingest/tsv_reader.hpp"
#include <string_view>

namespace di {

TsvInputReader::TsvInputReader(ByteSource& src, TsvConfig cfg)
  : InputReader(src, cfg.lines), cfg_(cfg) {}

InputReader::Frame TsvInputReader::read_tokens(std::vector<std::string>& tokens,
                                               std::string& err) {
  tokens.clear();
  ChunkReader& src = lines();
  switch (src.next_line(line_)) {
    case ChunkReader::Status::End:   return Frame::End;
    case ChunkReader::Status::Error: err = src.error(); return Frame::Error;
    case ChunkReader::Status::Line:  break;
  }

  std::string_view s = line_;
  std::size_t start = 0;
  while (true) {
    std::size_t pos = s.find(cfg_.separator, start);
    if (pos == std::string_view::npos) {
      tokens.emplace_back(s.substr(start));
      return Frame::Ok;
    }
    tokens.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

}

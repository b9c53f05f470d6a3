#include "delim_ingest/csv_reader.hpp"
#include <string_view>
#include <utility>

namespace di {

CsvInputReader::CsvInputReader(ByteSource& src, CsvConfig cfg)
  : InputReader(src, cfg.lines), cfg_(cfg) {}

static std::string at(std::uint64_t line, std::size_t col, const char* what) {
  return "parse error on line " + std::to_string(line) + ", column " +
         std::to_string(col) + ": " + what;
}

InputReader::Frame CsvInputReader::read_tokens(std::vector<std::string>& tokens,
                                               std::string& err) {
  tokens.clear();
  ChunkReader& src = lines();

  // skip blank lines
  while (true) {
    ChunkReader::Status st = src.next_line(line_);
    if (st == ChunkReader::Status::End) return Frame::End;
    if (st == ChunkReader::Status::Error) { err = src.error(); return Frame::Error; }
    if (!line_.empty()) break;
  }

  const std::size_t max_bytes = cfg_.lines.max_record_bytes;
  std::size_t record_bytes = line_.size();
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;
  std::string field;
  std::string_view s = line_;
  std::size_t p = 0;

  while (true) {
    if (p == s.size()) {
      if (mode != Mode::Quoted) {
        tokens.push_back(std::move(field));
        return Frame::Ok;
      }
      // quoted field continues on the next line
      field.push_back('\n');
      ChunkReader::Status st = src.next_line(line_);
      if (st == ChunkReader::Status::Error) { err = src.error(); return Frame::Error; }
      if (st == ChunkReader::Status::End) {
        err = at(src.line_number(), s.size() + 1, "extraneous or missing \" in quoted-field");
        return Frame::Error;
      }
      record_bytes += line_.size() + 1;
      if (record_bytes > max_bytes) {
        err = "record ending on line " + std::to_string(src.line_number()) + " exceeds " +
              std::to_string(max_bytes) + " bytes";
        return Frame::Error;
      }
      s = line_;
      p = 0;
      continue;
    }

    const char c = s[p];
    switch (mode) {
      case Mode::FieldStart:
        if (cfg_.trim_leading_space && (c == ' ' || c == '\t') && c != cfg_.delimiter) {
          ++p;
        } else if (c == cfg_.quote) {
          mode = Mode::Quoted;
          ++p;
        } else {
          mode = Mode::Unquoted;  // reprocess c as field content
        }
        break;
      case Mode::Unquoted:
        if (c == cfg_.delimiter) {
          tokens.push_back(std::move(field));
          field.clear();
          mode = Mode::FieldStart;
        } else if (c == cfg_.quote) {
          err = at(src.line_number(), p + 1, "bare \" in non-quoted-field");
          return Frame::Error;
        } else {
          field.push_back(c);
        }
        ++p;
        break;
      case Mode::Quoted:
        if (c == cfg_.quote) mode = Mode::QuoteEscape;
        else field.push_back(c);
        ++p;
        break;
      case Mode::QuoteEscape:
        if (c == cfg_.quote) {
          field.push_back(c);             // escaped quote
          mode = Mode::Quoted;
        } else if (c == cfg_.delimiter) {
          tokens.push_back(std::move(field));
          field.clear();
          mode = Mode::FieldStart;
        } else {
          err = at(src.line_number(), p + 1, "extraneous or missing \" in quoted-field");
          return Frame::Error;
        }
        ++p;
        break;
    }
  }
}

}

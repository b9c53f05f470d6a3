#include "delim_ingest/chunk_reader.hpp"
#include "delim_ingest/byte_source.hpp"
#include <cstring>
#include <vector>

namespace di {

struct ChunkReader::Impl {
  ByteSource& src;
  Config cfg;
  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool eof{false};
  bool failed{false};
  std::uint64_t lines{0};
  std::string err;

  Impl(ByteSource& s, Config c)
    : src(s), cfg(c), buf(c.chunk_bytes ? c.chunk_bytes : 1) {}

  Status fail(std::string msg) {
    failed = true;
    err = std::move(msg);
    return Status::Error;
  }

  Status emit(std::string& out) {
    if (cfg.strip_cr) {
      while (!out.empty() && out.back() == '\r') out.pop_back();
    }
    ++lines;
    return Status::Line;
  }

  Status next_line(std::string& out) {
    out.clear();
    if (failed) return Status::Error;
    bool partial = false;

    while (true) {
      if (pos == len) {
        if (eof) return partial ? emit(out) : Status::End;
        std::size_t n = src.read(buf.data(), buf.size());
        if (n == 0) {
          if (src.failed()) {
            std::string why = src.error();
            return fail(why.empty() ? std::string("read failed") : why);
          }
          eof = true;
          continue;
        }
        pos = 0;
        len = n;
      }

      const char* start = buf.data() + pos;
      const void* hit = std::memchr(start, '\n', len - pos);
      std::size_t take = hit ? static_cast<std::size_t>(static_cast<const char*>(hit) - start)
                             : len - pos;
      if (out.size() + take > cfg.max_record_bytes) {
        return fail("line " + std::to_string(lines + 1) + " exceeds " +
                    std::to_string(cfg.max_record_bytes) + " bytes");
      }
      out.append(start, take);
      partial = true;
      if (hit) {
        pos += take + 1;
        return emit(out);
      }
      pos = len;
    }
  }
};

ChunkReader::ChunkReader(ByteSource& src)
  : ChunkReader(src, Config{}) {}

ChunkReader::ChunkReader(ByteSource& src, Config cfg)
  : p_(new Impl(src, cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

ChunkReader::Status ChunkReader::next_line(std::string& out) { return p_->next_line(out); }

bool ChunkReader::for_each_line(const LineCallback& cb) {
  std::string line;
  while (true) {
    Status st = p_->next_line(line);
    if (st == Status::End) return true;
    if (st == Status::Error) return false;
    if (!cb(line)) return true;
  }
}

const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::line_number() const noexcept { return p_->lines; }

}

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace di {

class ByteSource;

// Splits a byte source into '\n'-terminated lines, pulling fixed-size chunks.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  enum class Status { Line, End, Error };

  explicit ChunkReader(ByteSource& src);      // uses default Config{}
  ChunkReader(ByteSource& src, Config cfg);   // explicit Config
  ~ChunkReader();
  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Next line without its terminator. A final unterminated line is still a line.
  Status next_line(std::string& out);

  // Returning false from the callback stops the scan early.
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  const std::string& error() const noexcept;
  std::uint64_t line_number() const noexcept;   // lines returned so far

private:
  struct Impl; Impl* p_;
};

}

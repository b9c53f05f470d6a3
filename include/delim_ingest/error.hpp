#pragma once
#include <cstdint>
#include <string>

namespace di {

enum class ErrorKind {
  Header,      // missing/malformed header or rejected field names
  Read,        // I/O or framing failure while reading a record
  Conversion,  // record content could not be turned into a document
  Cancelled    // stopped by the consumer before end of input
};

struct ImportError {
  ErrorKind kind = ErrorKind::Read;
  // 0-based sequence index of the failing record (unused for Header).
  std::uint64_t index = 0;
  std::string message;

  std::uint64_t ordinal() const noexcept { return index + 1; }

  // One-line description, e.g. "read error on entry #4: ...".
  std::string what() const;
};

ImportError header_error(std::string msg);
ImportError read_error(std::uint64_t index, std::string msg);
ImportError conversion_error(std::uint64_t index, std::string msg);

const char* kind_name(ErrorKind k) noexcept;

}

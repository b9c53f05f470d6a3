#include "delim_ingest/error.hpp"
#include <utility>

namespace di {

const char* kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Header:     return "header";
    case ErrorKind::Read:       return "read";
    case ErrorKind::Conversion: return "conversion";
    case ErrorKind::Cancelled:  return "cancelled";
  }
  return "unknown";
}

std::string ImportError::what() const {
  switch (kind) {
    case ErrorKind::Header:
      return "header error: " + message;
    case ErrorKind::Read:
      return "read error on entry #" + std::to_string(ordinal()) + ": " + message;
    case ErrorKind::Conversion:
      return "conversion error on document #" + std::to_string(ordinal()) + ": " + message;
    case ErrorKind::Cancelled:
      return "import cancelled: " + message;
  }
  return message;
}

ImportError header_error(std::string msg) {
  return ImportError{ErrorKind::Header, 0, std::move(msg)};
}

ImportError read_error(std::uint64_t index, std::string msg) {
  return ImportError{ErrorKind::Read, index, std::move(msg)};
}

ImportError conversion_error(std::uint64_t index, std::string msg) {
  return ImportError{ErrorKind::Conversion, index, std::move(msg)};
}

}

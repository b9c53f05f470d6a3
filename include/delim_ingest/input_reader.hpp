#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "delim_ingest/byte_source.hpp"
#include "delim_ingest/chunk_reader.hpp"
#include "delim_ingest/error.hpp"
#include "delim_ingest/record.hpp"

namespace di {

// Frames a delimited byte stream into raw records. Format specifics live in
// read_tokens(); header handling, sequencing and accounting live here.
// next_record() is meant for a single producer thread; the counters may be
// read from any thread.
class InputReader {
public:
  enum class Next { Record, End, Failed };

  virtual ~InputReader() = default;
  InputReader(const InputReader&) = delete;
  InputReader& operator=(const InputReader&) = delete;

  // Reads one framing unit and uses it as the field list.
  // On failure error() holds a Header error.
  bool read_header();

  // Uses caller supplied field names instead of a header line.
  bool set_fields(std::vector<std::string> names);

  // Next record, or End at end of input. Failed leaves a Read error in
  // error() tagged with the failing record's index. The sequence is over
  // after End or Failed.
  Next next_record(RawRecord& out);

  const FieldList& fields() const noexcept { return fields_; }
  const ImportError& error() const noexcept { return err_; }

  std::uint64_t bytes_consumed() const noexcept { return tracker_.size(); }
  std::uint64_t records_processed() const noexcept {
    return processed_.load(std::memory_order_relaxed);
  }

  virtual const char* format_name() const noexcept = 0;

protected:
  enum class Frame { Ok, End, Error };

  InputReader(ByteSource& src, ChunkReader::Config cfg);

  // Reads the next unit into `tokens`; on Error fills `err`.
  virtual Frame read_tokens(std::vector<std::string>& tokens, std::string& err) = 0;

  ChunkReader& lines() noexcept { return lines_; }

private:
  SizeTrackingSource tracker_;
  ChunkReader lines_;
  FieldList fields_;
  ImportError err_;
  std::atomic<std::uint64_t> processed_{0};
  bool done_{false};
  bool failed_{false};
};

}

#include "delim_ingest/input_reader.hpp"
#include "delim_ingest/field_rules.hpp"
#include <utility>

namespace di {

InputReader::InputReader(ByteSource& src, ChunkReader::Config cfg)
  : tracker_(src), lines_(tracker_, cfg) {}

bool InputReader::read_header() {
  std::vector<std::string> names;
  std::string why;
  switch (read_tokens(names, why)) {
    case Frame::End:
      err_ = header_error("no header line: input is empty");
      return false;
    case Frame::Error:
      err_ = header_error("failed to read header: " + why);
      return false;
    case Frame::Ok:
      break;
  }
  return set_fields(std::move(names));
}

bool InputReader::set_fields(std::vector<std::string> names) {
  std::string why;
  if (!validate_fields(names, &why)) {
    err_ = header_error(why);
    return false;
  }
  fields_ = make_field_list(std::move(names));
  return true;
}

InputReader::Next InputReader::next_record(RawRecord& out) {
  if (done_) return failed_ ? Next::Failed : Next::End;
  const std::uint64_t index = processed_.load(std::memory_order_relaxed);
  if (!fields_) {
    done_ = failed_ = true;
    err_ = read_error(index, "no field list: read a header or set fields first");
    return Next::Failed;
  }

  std::vector<std::string> tokens;
  std::string why;
  switch (read_tokens(tokens, why)) {
    case Frame::End:
      done_ = true;
      return Next::End;
    case Frame::Error:
      done_ = failed_ = true;
      err_ = read_error(index, why);
      return Next::Failed;
    case Frame::Ok:
      break;
  }

  out.fields = fields_;
  out.tokens = std::move(tokens);
  out.index = index;
  processed_.store(index + 1, std::memory_order_relaxed);
  return Next::Record;
}

}

#pragma once
#include "delim_ingest/error.hpp"
#include "delim_ingest/parse_policy.hpp"
#include "delim_ingest/record.hpp"

namespace di {

// Turns one raw record into a document. Implementations are called from
// several worker threads at once, each with a different record.
class Converter {
public:
  virtual ~Converter() = default;

  // On failure returns false and, when err_out is set, fills it in.
  virtual bool convert(const RawRecord& rec, Document& out, ImportError* err_out) const = 0;
};

struct ConverterConfig {
  ParsePolicy policy;
  bool ignore_blanks = false;   // omit fields whose token is empty
};

// Default converter: token i becomes field i, typed by ParsePolicy.
class TokenConverter : public Converter {
public:
  TokenConverter() = default;
  explicit TokenConverter(ConverterConfig cfg) : cfg_(cfg) {}

  bool convert(const RawRecord& rec, Document& out, ImportError* err_out) const override;

private:
  ConverterConfig cfg_;
};

}

#include "delim_ingest/converter.hpp"

namespace di {

bool TokenConverter::convert(const RawRecord& rec, Document& out, ImportError* err_out) const {
  const std::size_t nfields = rec.fields ? rec.fields->size() : 0;
  if (rec.tokens.size() > nfields) {
    if (err_out) {
      *err_out = conversion_error(rec.index,
          "record has " + std::to_string(rec.tokens.size()) + " tokens but only " +
          std::to_string(nfields) + " fields");
    }
    return false;
  }

  out.reserve(rec.tokens.size());
  for (std::size_t i = 0; i < rec.tokens.size(); ++i) {
    const std::string& tok = rec.tokens[i];
    if (cfg_.ignore_blanks && tok.empty()) continue;
    out.append((*rec.fields)[i], cfg_.policy.infer(tok));
  }
  return true;
}

}

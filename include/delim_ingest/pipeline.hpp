#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "delim_ingest/converter.hpp"
#include "delim_ingest/error.hpp"
#include "delim_ingest/input_reader.hpp"
#include "delim_ingest/record.hpp"

namespace di {

// Receives each document on the thread that called stream(). Returning
// false stops the import (reported as a Cancelled error).
using DocumentCallback = std::function<bool(std::uint64_t index, Document&& doc)>;

// Decode & reassembly engine.
//
// One producer thread pulls raw records from the reader into a queue of
// `workers` slots, `workers` threads convert them, and the calling thread
// hands finished documents to the callback. In ordered mode documents are
// released strictly by sequence index through a reassembly ring of `window`
// slots; otherwise in completion order.
//
// The first failure (read or conversion) stops admission of new records and
// becomes the return value. In ordered mode every document before the failing
// record is still delivered and the failure reported is the one with the
// lowest index; in unordered mode nothing is delivered after the failure is
// seen. Header errors are the reader's business and never reach stream().
class Pipeline {
public:
  struct Config {
    bool        ordered = false;
    std::size_t workers = 0;   // 0 -> hardware concurrency
    std::size_t window  = 0;   // reassembly/output slots; 0 -> 2 * workers
  };

  Pipeline();
  explicit Pipeline(Config cfg);
  ~Pipeline();
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Runs one import to completion. nullopt means every record became a
  // document and was delivered. A Pipeline runs at most one stream at a time.
  std::optional<ImportError> stream(InputReader& source, const Converter& conv,
                                    const DocumentCallback& on_doc);

  // Stops a running stream from any thread. No-op when idle.
  void cancel();

  std::uint64_t documents_emitted() const noexcept;
  std::size_t workers() const noexcept;
  std::size_t window() const noexcept;

private:
  struct Impl; Impl* p_;
};

std::size_t recommended_workers() noexcept;

}

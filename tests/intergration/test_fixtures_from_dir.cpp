#include "delim_ingest/byte_source.hpp"
#include "delim_ingest/converter.hpp"
#include "delim_ingest/csv_reader.hpp"
#include "delim_ingest/pipeline.hpp"
#include "delim_ingest/tsv_reader.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <cctype>
#include <cstring>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

struct Res {
  bool ok{true};
  uint64_t docs{0};
  uint64_t bytes{0};
  std::string err;
};

static Res run_file(const fs::path& f, bool tsv, bool ordered) {
  Res r;
  di::FileSource file(f.string());
  if (!file.open()) { r.ok = false; r.err = file.error(); return r; }

  std::unique_ptr<di::InputReader> reader;
  if (tsv) reader = std::make_unique<di::TsvInputReader>(file);
  else     reader = std::make_unique<di::CsvInputReader>(file);

  if (!reader->read_header()) {
    r.ok = false;
    r.err = reader->error().what();
    return r;
  }

  di::Pipeline::Config cfg;
  cfg.ordered = ordered;
  cfg.workers = 3;
  di::Pipeline pipe(cfg);
  di::TokenConverter conv;
  auto err = pipe.stream(*reader, conv, [&](std::uint64_t, di::Document&&){ ++r.docs; return true; });
  r.bytes = reader->bytes_consumed();
  if (err) { r.ok = false; r.err = err->what(); }
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    const std::string e = p.extension().string();

    bool tsv;
    if (ieq_ext(e, ".csv")) tsv = false;
    else if (ieq_ext(e, ".tsv")) tsv = true;
    else continue;

    const bool expect_ok = expected_ok_for(p);
    for (bool ordered : {true, false}) {
      Res r = run_file(p, tsv, ordered);
      bool verdict = (r.ok == expect_ok);
      if (verdict && r.ok && r.bytes != fs::file_size(p)) verdict = false;

      ++total; verdict ? ++passed : ++failed;

      std::cout << (verdict ? "[PASS] " : "[FAIL] ") << p.filename().string()
                << "  ordered=" << (ordered ? "true" : "false")
                << "  docs=" << r.docs
                << "  bytes=" << r.bytes
                << "  expected_ok=" << (expect_ok ? "true" : "false") << "\n";
      if (!verdict && !r.err.empty())
        std::cout << "       error: " << r.err << "\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}

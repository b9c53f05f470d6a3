#include "delim_ingest/byte_source.hpp"
#include "delim_ingest/chunk_reader.hpp"
#include "delim_ingest/converter.hpp"
#include "delim_ingest/csv_reader.hpp"
#include "delim_ingest/field_rules.hpp"
#include "delim_ingest/json_writer.hpp"
#include "delim_ingest/path_utils.hpp"
#include "delim_ingest/pipeline.hpp"
#include "delim_ingest/tsv_reader.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace {

struct Cli {
  std::string type;            // csv|tsv; empty -> from extension
  bool headerline = false;
  std::string fields;          // comma separated
  std::string field_file;      // one name per line
  std::size_t workers = 0;     // 0 -> hardware concurrency
  bool ordered = false;
  bool ignore_blanks = false;
  bool infer_types = true;
  std::string out;             // empty -> stdout
  std::string summary;
  std::string input;           // path or "-"
};

void usage(std::ostream& os) {
  os <<
    "Usage: delim-ingest [--type=csv|tsv] [--headerline | --fields=a,b,c | --field-file=PATH]\n"
    "                    [--workers=N] [--ordered|--unordered] [--ignore-blanks] [--no-infer]\n"
    "                    [--out=PATH] [--summary=PATH] <file>|-\n";
}

bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string num;
    if (eat("--workers=", &num)) {
      auto [ptr, ec] = std::from_chars(num.data(), num.data() + num.size(), c.workers);
      if (ec != std::errc() || ptr != num.data() + num.size()) {
        std::cerr << "[ingest] bad --workers value: " << num << "\n";
        return false;
      }
      continue;
    }
    if (eat("--type=", &c.type)) continue;
    if (eat("--fields=", &c.fields)) continue;
    if (eat("--field-file=", &c.field_file)) continue;
    if (eat("--out=", &c.out)) continue;
    if (eat("--summary=", &c.summary)) continue;
    if (a == "--headerline")    { c.headerline = true;     continue; }
    if (a == "--ordered")       { c.ordered = true;        continue; }
    if (a == "--unordered")     { c.ordered = false;       continue; }
    if (a == "--ignore-blanks") { c.ignore_blanks = true;  continue; }
    if (a == "--no-infer")      { c.infer_types = false;   continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a == "-" || a.rfind("--", 0) != 0) {
      if (!c.input.empty()) { std::cerr << "[ingest] more than one input given\n"; return false; }
      c.input = a;
      continue;
    }
    std::cerr << "[ingest] unknown option: " << a << "\n";
    return false;
  }
  if (c.input.empty()) { std::cerr << "[ingest] no input file\n"; return false; }
  const int sources = int(c.headerline) + int(!c.fields.empty()) + int(!c.field_file.empty());
  if (sources != 1) {
    std::cerr << "[ingest] need exactly one of --headerline, --fields, --field-file\n";
    return false;
  }
  return true;
}

bool load_field_file(const std::string& path, std::vector<std::string>& out) {
  di::FileSource src(path);
  if (!src.open()) { std::cerr << "[ingest] cannot open field file: " << src.error() << "\n"; return false; }
  di::ChunkReader lines(src);
  bool ok = lines.for_each_line([&](std::string_view s){
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    if (!s.empty()) out.emplace_back(s);
    return true;
  });
  if (!ok) std::cerr << "[ingest] field file: " << lines.error() << "\n";
  return ok;
}

std::unique_ptr<di::InputReader> make_reader(di::FileFormat fmt, di::ByteSource& src) {
  if (fmt == di::FileFormat::TSV) return std::make_unique<di::TsvInputReader>(src);
  return std::make_unique<di::CsvInputReader>(src);
}

bool write_summary(const std::string& path, const di::RunSummary& s) {
  if (!di::ensure_parent_dirs(path)) return false;
  std::ofstream out(path, std::ios::binary);
  out << di::RunJsonWriter::to_json(s) << "\n";
  return bool(out);
}

int run_import(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  // --- choose format
  di::FileFormat fmt = cli.type.empty() ? di::detect_format(cli.input)
                                        : di::parse_format(cli.type);
  if (fmt == di::FileFormat::Unknown) {
    std::cerr << "[ingest] cannot tell input type of '" << cli.input
              << "'; pass --type=csv or --type=tsv\n";
    return 2;
  }

  di::FileSource file(cli.input);
  if (!file.open()) {
    std::cerr << "[ingest] cannot open input: " << file.error() << "\n";
    return 2;
  }
  auto reader = make_reader(fmt, file);

  // --- field list
  bool have_fields = false;
  if (cli.headerline) {
    have_fields = reader->read_header();
  } else {
    std::vector<std::string> names = cli.fields.empty() ? std::vector<std::string>{}
                                                        : di::parse_field_list(cli.fields);
    if (!cli.field_file.empty() && !load_field_file(cli.field_file, names)) return 2;
    have_fields = reader->set_fields(std::move(names));
  }
  if (!have_fields) {
    std::cerr << "[ingest] " << reader->error().what() << "\n";
    return 2;
  }
  std::cerr << "[ingest] using fields: " << di::join_fields(*reader->fields()) << "\n";

  // --- output
  std::ofstream file_out;
  if (!cli.out.empty()) {
    if (!di::ensure_parent_dirs(cli.out)) {
      std::cerr << "[ingest] cannot create directory for " << cli.out << "\n";
      return 2;
    }
    file_out.open(cli.out, std::ios::binary);
    if (!file_out) { std::cerr << "[ingest] cannot open output: " << cli.out << "\n"; return 2; }
  }
  std::ostream& os = cli.out.empty() ? std::cout : file_out;

  // --- convert
  di::ConverterConfig ccfg;
  ccfg.ignore_blanks = cli.ignore_blanks;
  ccfg.policy.infer_types = cli.infer_types;
  di::TokenConverter conv(ccfg);

  di::Pipeline::Config pcfg;
  pcfg.ordered = cli.ordered;
  pcfg.workers = cli.workers;
  di::Pipeline pipeline(pcfg);

  std::string line;
  bool write_failed = false;
  auto err = pipeline.stream(*reader, conv, [&](std::uint64_t, di::Document&& doc){
    line.clear();
    di::append_json(line, doc);
    line += '\n';
    os.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!os) write_failed = true;
    return !write_failed;
  });
  os.flush();

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();
  const std::uint64_t bytes = reader->bytes_consumed();
  const double sec = wall_ms / 1000.0;

  di::RunSummary s;
  s.documents = pipeline.documents_emitted();
  s.records = reader->records_processed();
  s.bytes = bytes;
  s.wall_time_ms = wall_ms;
  s.throughput_mb_s = sec > 0.0 ? (bytes / (1024.0 * 1024.0)) / sec : 0.0;
  s.filename = cli.input;
  s.format = reader->format_name();
  s.ordered = cli.ordered;
  s.workers = pipeline.workers();
  if (err) {
    s.ok = false;
    s.error_kind = di::kind_name(err->kind);
    s.error = write_failed ? std::string("write to output failed") : err->what();
    s.error_record = err->kind == di::ErrorKind::Cancelled ? 0 : err->ordinal();
  }

  if (!cli.summary.empty() && !write_summary(cli.summary, s))
    std::cerr << "[ingest] failed to write summary: " << cli.summary << "\n";

  if (err) {
    std::cerr << "[ingest] " << s.error << "\n";
    std::cerr << "[ingest] imported " << s.documents << " documents before the error\n";
    return 3;
  }
  std::cerr << "[ingest] imported " << s.documents << " documents"
            << " (" << bytes << " bytes, " << wall_ms << " ms)\n";
  return 0;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) {
    usage(std::cerr);
    return 2;
  }
  return run_import(cli);
}

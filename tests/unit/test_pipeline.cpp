#include "delim_ingest/byte_source.hpp"
#include "delim_ingest/converter.hpp"
#include "delim_ingest/csv_reader.hpp"
#include "delim_ingest/pipeline.hpp"
#include "delim_ingest/tsv_reader.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int failures = 0;
static void expect(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

// Delays each record by a pseudo-random amount derived from its index, so
// workers finish out of input order.
class JitterConverter : public di::Converter {
public:
  JitterConverter(const di::Converter& inner, unsigned max_us) : inner_(inner), max_us_(max_us) {}
  bool convert(const di::RawRecord& rec, di::Document& out, di::ImportError* err) const override {
    const unsigned us = static_cast<unsigned>((rec.index * 2654435761u) % (max_us_ + 1));
    std::this_thread::sleep_for(std::chrono::microseconds(us));
    return inner_.convert(rec, out, err);
  }
private:
  const di::Converter& inner_;
  unsigned max_us_;
};

// Makes one index much slower than the rest.
class SlowIndexConverter : public di::Converter {
public:
  SlowIndexConverter(const di::Converter& inner, std::uint64_t slow) : inner_(inner), slow_(slow) {}
  bool convert(const di::RawRecord& rec, di::Document& out, di::ImportError* err) const override {
    if (rec.index == slow_) std::this_thread::sleep_for(std::chrono::milliseconds(30));
    return inner_.convert(rec, out, err);
  }
private:
  const di::Converter& inner_;
  std::uint64_t slow_;
};

class ThrowingConverter : public di::Converter {
public:
  bool convert(const di::RawRecord& rec, di::Document&, di::ImportError*) const override {
    if (rec.index == 1) throw std::runtime_error("boom");
    return true;
  }
};

class OddThrowConverter : public di::Converter {
public:
  bool convert(const di::RawRecord& rec, di::Document&, di::ImportError*) const override {
    if (rec.index == 1) throw 42;
    return true;
  }
};

static std::string make_csv(std::size_t rows) {
  std::string s = "id,name,score\n";
  for (std::size_t i = 0; i < rows; ++i) {
    s += std::to_string(i) + ",name_" + std::to_string(i) + "," + std::to_string(i) + ".5\n";
  }
  return s;
}

struct Collected {
  std::vector<std::uint64_t> order;
  std::vector<di::Document> docs;
};

static std::optional<di::ImportError> run(const std::string& input, bool ordered,
                                          std::size_t workers, const di::Converter& conv,
                                          Collected& out, std::size_t window = 0) {
  di::StringSource src(input, 7);
  di::CsvInputReader reader(src);
  if (!reader.read_header()) {
    std::cerr << "[FAIL] header: " << reader.error().what() << "\n";
    ++failures;
    return reader.error();
  }
  di::Pipeline::Config cfg;
  cfg.ordered = ordered;
  cfg.workers = workers;
  cfg.window = window;
  di::Pipeline pipe(cfg);
  auto err = pipe.stream(reader, conv, [&](std::uint64_t idx, di::Document&& d){
    out.order.push_back(idx);
    out.docs.push_back(std::move(d));
    return true;
  });
  if (!err) {
    expect(reader.bytes_consumed() == input.size(), "bytes_consumed == input length");
    expect(pipe.documents_emitted() == out.docs.size(), "documents_emitted");
  }
  return err;
}

int main(){
  di::TokenConverter base;

  // header a,b,c with two records, any worker count
  for (std::size_t w : {1u, 2u, 3u, 8u}) {
    Collected c;
    auto err = run("a,b,c\n1,2,3\n4,5,6\n", true, w, base, c);
    expect(!err, "scenario ok, workers=" + std::to_string(w));
    expect(c.docs.size() == 2, "scenario two docs");
    if (c.docs.size() == 2) {
      const di::Document& d0 = c.docs[0];
      const di::Document& d1 = c.docs[1];
      expect(d0.size() == 3 && d0[0].name == "a" && d0[0].value.raw == "1" &&
             d0[1].name == "b" && d0[1].value.raw == "2" &&
             d0[2].name == "c" && d0[2].value.raw == "3", "first document");
      expect(d1[0].value.raw == "4" && d1[1].value.raw == "5" && d1[2].value.raw == "6",
             "second document");
    }
  }

  // ordered mode under scrambled completion timing
  {
    const std::size_t n = 400;
    const std::string input = make_csv(n);
    JitterConverter jitter(base, 300);
    for (std::size_t window : {0u, 3u}) {
      Collected c;
      auto err = run(input, true, 8, jitter, c, window);
      expect(!err, "ordered jitter ok");
      expect(c.order.size() == n, "ordered count " + std::to_string(c.order.size()));
      bool in_order = true;
      for (std::size_t i = 0; i < c.order.size(); ++i) {
        if (c.order[i] != i) { in_order = false; break; }
        const di::Value* v = c.docs[i].find("name");
        if (!v || v->raw != "name_" + std::to_string(i)) { in_order = false; break; }
      }
      expect(in_order, "ordered output follows input, window=" + std::to_string(window));
    }
  }

  // unordered mode: same multiset, any order
  {
    const std::size_t n = 400;
    const std::string input = make_csv(n);
    JitterConverter jitter(base, 300);
    Collected c;
    auto err = run(input, false, 8, jitter, c);
    expect(!err, "unordered ok");
    std::set<std::uint64_t> seen(c.order.begin(), c.order.end());
    expect(c.order.size() == n && seen.size() == n && *seen.rbegin() == n - 1,
           "unordered delivers each record once");
    for (std::size_t i = 0; i < c.docs.size(); ++i) {
      const di::Value* id = c.docs[i].find("id");
      if (!id || id->i != static_cast<std::int64_t>(c.order[i])) {
        expect(false, "unordered document matches its index");
        break;
      }
    }
  }

  // record 3 of 5 malformed (too many tokens): ordered stops right before it
  {
    const std::string input = "a,b\n1,2\n3,4\n5,6,7\n8,9\n10,11\n";
    for (std::size_t w : {1u, 4u}) {
      Collected c;
      auto err = run(input, true, w, base, c);
      expect(err && err->kind == di::ErrorKind::Conversion, "ordered conversion error");
      expect(err && err->index == 2 && err->ordinal() == 3, "error tagged with record 3");
      expect(c.order == std::vector<std::uint64_t>({0, 1}), "ordered prefix before failure");
    }
    Collected c;
    auto err = run(input, false, 4, base, c);
    expect(err && err->kind == di::ErrorKind::Conversion && err->ordinal() == 3,
           "unordered conversion error");
    expect(std::find(c.order.begin(), c.order.end(), 2u) == c.order.end(), "failed record not emitted");
  }

  // two bad records; the later one fails first, ordered mode still reports the earlier
  {
    const std::string input = "a,b\n1,2\n3,4\n5,6,7\n8,9\n10,11,12\n13,14\n";
    SlowIndexConverter slow(base, 2);
    Collected c;
    auto err = run(input, true, 4, slow, c);
    expect(err && err->ordinal() == 3, "lowest failing record reported");
    expect(c.order == std::vector<std::uint64_t>({0, 1}), "prefix before lowest failure");
  }

  // read error on entry #4 travels after the records read before it
  {
    const std::string input = "a,b\n1,2\n3,4\n5,6\n7,x\"y\n9,10\n";
    Collected c;
    auto err = run(input, true, 3, base, c);
    expect(err && err->kind == di::ErrorKind::Read, "read error kind");
    expect(err && err->ordinal() == 4, "read error ordinal");
    expect(c.order == std::vector<std::uint64_t>({0, 1, 2}), "documents before read error");
  }

  // converter exceptions become conversion errors
  {
    ThrowingConverter thrower;
    Collected c;
    auto err = run("a\n1\n2\n3\n", true, 2, thrower, c);
    expect(err && err->kind == di::ErrorKind::Conversion && err->message == "boom",
           "exception mapped to conversion error");
    expect(c.order == std::vector<std::uint64_t>({0}), "document before throwing record");
  }

  // a non-std exception is still a conversion error, in both modes
  {
    OddThrowConverter odd;
    for (bool ordered : {true, false}) {
      Collected c;
      auto err = run("a\n1\n2\n3\n", ordered, 2, odd, c);
      expect(err && err->kind == di::ErrorKind::Conversion && err->ordinal() == 2 &&
             err->message == "unknown exception", "non-std exception mapped to conversion error");
    }
  }

  // empty body
  {
    Collected c;
    auto err = run("a,b\n", true, 4, base, c);
    expect(!err && c.docs.empty(), "header only input");
  }

  // consumer stops early: returns promptly, no thread left blocked
  {
    const std::string input = make_csv(20000);
    di::StringSource src(input);
    di::CsvInputReader reader(src);
    reader.read_header();
    di::Pipeline::Config cfg;
    cfg.ordered = true;
    cfg.workers = 4;
    di::Pipeline pipe(cfg);
    std::size_t got = 0;
    auto err = pipe.stream(reader, base, [&](std::uint64_t, di::Document&&){ return ++got < 3; });
    expect(err && err->kind == di::ErrorKind::Cancelled, "callback stop reported as cancelled");
    expect(pipe.documents_emitted() == 2, "two documents accepted before stop");
    expect(reader.records_processed() < 20000, "reader stopped early");
  }

  // cancel() from inside the callback, unordered
  {
    const std::string input = make_csv(20000);
    di::StringSource src(input);
    di::CsvInputReader reader(src);
    reader.read_header();
    di::Pipeline::Config cfg;
    cfg.workers = 4;
    di::Pipeline pipe(cfg);
    std::size_t got = 0;
    auto err = pipe.stream(reader, base, [&](std::uint64_t, di::Document&&){
      if (++got == 5) pipe.cancel();
      return true;
    });
    expect(err && err->kind == di::ErrorKind::Cancelled, "cancel() reported");
    expect(got <= 5 + pipe.window(), "little delivered after cancel");
  }

  // TSV through the same engine
  {
    const std::string input = "x\ty\n1\ta\n2\tb\n3\tc";
    di::StringSource src(input);
    di::TsvInputReader reader(src);
    expect(reader.read_header(), "tsv header");
    di::Pipeline::Config cfg;
    cfg.ordered = true;
    cfg.workers = 2;
    di::Pipeline pipe(cfg);
    std::vector<std::string> ys;
    auto err = pipe.stream(reader, base, [&](std::uint64_t, di::Document&& d){
      ys.push_back(d[1].value.raw);
      return true;
    });
    expect(!err, "tsv stream ok");
    expect(ys == std::vector<std::string>({"a", "b", "c"}), "tsv documents");
    expect(reader.bytes_consumed() == input.size(), "tsv bytes_consumed");
    expect(reader.records_processed() == 3, "tsv records_processed");
  }

  if (failures) return 1;
  std::cout << "[PASS] pipeline\n";
  return 0;
}

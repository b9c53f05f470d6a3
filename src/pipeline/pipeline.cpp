#include "delim_ingest/pipeline.hpp"
#include "delim_ingest/bounded_queue.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace di {

std::size_t recommended_workers() noexcept {
  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) return 4;
  return std::min(hw, 32u);
}

namespace {

// A record on its way to a worker. A read failure travels the same path so
// that ordered mode reports it after every record read before it.
struct Work {
  RawRecord rec;
  std::optional<ImportError> failure;
};

struct Result {
  std::uint64_t index = 0;
  bool ok = false;
  Document doc;
  ImportError err;
};

// Worker -> consumer hand-off. Ordered mode keeps `window` slots addressed by
// index % window and releases the contiguous run starting at next_; a worker
// whose index is a full window ahead waits. Unordered mode is a bounded FIFO.
class ResultBuffer {
public:
  ResultBuffer(bool ordered, std::size_t window, std::size_t producers)
    : ordered_(ordered), window_(window), ring_(ordered ? window : 0), producers_(producers) {}

  bool put(Result&& r) {
    std::unique_lock<std::mutex> lk(mu_);
    if (ordered_) {
      const std::uint64_t idx = r.index;
      cv_put_.wait(lk, [&]{ return stopped_ || idx < next_ + window_; });
      if (stopped_) return false;
      ring_[idx % window_] = std::move(r);
      if (idx == next_) cv_take_.notify_one();
    } else {
      cv_put_.wait(lk, [&]{ return stopped_ || fifo_.size() < window_; });
      if (stopped_) return false;
      fifo_.push_back(std::move(r));
      cv_take_.notify_one();
    }
    return true;
  }

  // Appends every releasable result to `out`. false when stopped, or when all
  // producers are done and nothing more can be released.
  bool take(std::vector<Result>& out) {
    std::unique_lock<std::mutex> lk(mu_);
    if (ordered_) {
      cv_take_.wait(lk, [&]{
        return stopped_ || producers_ == 0 || ring_[next_ % window_].has_value();
      });
      if (stopped_ || !ring_[next_ % window_]) return false;
      for (auto* slot = &ring_[next_ % window_]; slot->has_value();
           slot = &ring_[next_ % window_]) {
        out.push_back(std::move(**slot));
        slot->reset();
        ++next_;
      }
    } else {
      cv_take_.wait(lk, [&]{ return stopped_ || producers_ == 0 || !fifo_.empty(); });
      if (stopped_ || fifo_.empty()) return false;
      while (!fifo_.empty()) {
        out.push_back(std::move(fifo_.front()));
        fifo_.pop_front();
      }
    }
    cv_put_.notify_all();
    return true;
  }

  void producer_done() {
    std::lock_guard<std::mutex> lk(mu_);
    if (producers_ > 0 && --producers_ == 0) cv_take_.notify_all();
  }

  void stop() {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
    cv_put_.notify_all();
    cv_take_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_put_, cv_take_;
  const bool ordered_;
  const std::size_t window_;
  std::vector<std::optional<Result>> ring_;
  std::deque<Result> fifo_;
  std::uint64_t next_{0};
  std::size_t producers_;
  bool stopped_{false};
};

// State of one stream() call.
struct Run {
  Run(bool ord, std::size_t workers, std::size_t window)
    : ordered(ord), queue(workers), results(ord, window, workers) {}

  const bool ordered;
  BoundedQueue<Work> queue;
  ResultBuffer results;
  std::atomic<bool> admit{true};
  std::atomic<bool> stopped{false};
  std::atomic<std::uint64_t> lowest_failure{std::numeric_limits<std::uint64_t>::max()};

  std::mutex err_mu;
  std::optional<ImportError> terminal;

  // First write wins.
  void latch(ImportError e) {
    std::lock_guard<std::mutex> lk(err_mu);
    if (!terminal) terminal = std::move(e);
  }

  // Stops everything; queued records are dropped.
  void halt() {
    admit.store(false);
    stopped.store(true);
    queue.abort();
    results.stop();
  }

  // Ordered mode: stop reading, but let queued records below `idx` finish so
  // the prefix before the failure is still delivered.
  void note_failure(std::uint64_t idx) {
    std::uint64_t cur = lowest_failure.load();
    while (idx < cur && !lowest_failure.compare_exchange_weak(cur, idx)) {}
    admit.store(false);
    queue.close();
  }

  std::optional<ImportError> take_terminal() {
    std::lock_guard<std::mutex> lk(err_mu);
    return terminal;
  }
};

void produce(Run& run, InputReader& src) {
  try {
    while (run.admit.load()) {
      Work w;
      InputReader::Next n = src.next_record(w.rec);
      if (n == InputReader::Next::End) break;
      const bool failed = (n == InputReader::Next::Failed);
      if (failed) {
        w.rec.index = src.error().index;
        w.failure = src.error();
      }
      // push fails only once the run is already stopping
      if (!run.queue.push(std::move(w)) || failed) break;
    }
  } catch (const std::exception& e) {
    run.latch(read_error(src.records_processed(), e.what()));
    run.halt();
  }
  run.queue.close();
}

void convert_records(Run& run, const Converter& conv) {
  Work w;
  while (!run.stopped.load() && run.queue.pop(w)) {
    const std::uint64_t idx = w.rec.index;
    if (run.ordered && idx > run.lowest_failure.load()) continue;

    Result r;
    r.index = idx;
    if (w.failure) {
      r.err = std::move(*w.failure);
    } else {
      try {
        r.ok = conv.convert(w.rec, r.doc, &r.err);
      } catch (const std::exception& e) {
        r.ok = false;
        r.err.message = e.what();
      } catch (...) {
        r.ok = false;
        r.err.message = "unknown exception";
      }
      if (!r.ok) {
        r.err.kind = ErrorKind::Conversion;
        r.err.index = idx;
        if (r.err.message.empty()) r.err.message = "record could not be converted";
      }
    }

    if (!r.ok) {
      if (!run.ordered) {
        run.latch(std::move(r.err));
        run.halt();
        break;
      }
      run.note_failure(idx);
    }
    if (!run.results.put(std::move(r))) break;
  }
  run.results.producer_done();
}

}

struct Pipeline::Impl {
  Config cfg;
  std::size_t workers;
  std::size_t window;
  std::atomic<std::uint64_t> emitted{0};
  std::mutex mu;
  Run* active{nullptr};

  explicit Impl(Config c)
    : cfg(c),
      workers(c.workers ? c.workers : recommended_workers()),
      window(c.window ? c.window : 2 * workers) {}
};

Pipeline::Pipeline() : Pipeline(Config{}) {}

Pipeline::Pipeline(Config cfg) : p_(new Impl(cfg)) {}

Pipeline::~Pipeline() { delete p_; }

std::optional<ImportError> Pipeline::stream(InputReader& source, const Converter& conv,
                                            const DocumentCallback& on_doc) {
  Run run(p_->cfg.ordered, p_->workers, p_->window);
  p_->emitted.store(0);
  {
    std::lock_guard<std::mutex> lk(p_->mu);
    p_->active = &run;
  }

  std::thread producer;
  std::vector<std::thread> pool;
  auto shutdown = [&] {
    run.halt();
    if (producer.joinable()) producer.join();
    for (auto& t : pool) if (t.joinable()) t.join();
    std::lock_guard<std::mutex> lk(p_->mu);
    p_->active = nullptr;
  };

  try {
    pool.reserve(p_->workers);
    for (std::size_t i = 0; i < p_->workers; ++i)
      pool.emplace_back(convert_records, std::ref(run), std::cref(conv));
    producer = std::thread(produce, std::ref(run), std::ref(source));

    std::vector<Result> batch;
    bool more = true;
    while (more && run.results.take(batch)) {
      for (auto& r : batch) {
        if (run.stopped.load()) { more = false; break; }
        if (!r.ok) {
          run.latch(std::move(r.err));
          more = false;
          break;
        }
        if (!on_doc(r.index, std::move(r.doc))) {
          run.latch(ImportError{ErrorKind::Cancelled, r.index, "stopped by consumer"});
          more = false;
          break;
        }
        p_->emitted.fetch_add(1);
      }
      batch.clear();
    }
  } catch (...) {
    shutdown();
    throw;
  }

  shutdown();
  return run.take_terminal();
}

void Pipeline::cancel() {
  std::lock_guard<std::mutex> lk(p_->mu);
  if (!p_->active) return;
  p_->active->latch(ImportError{ErrorKind::Cancelled, 0, "stopped by caller"});
  p_->active->halt();
}

std::uint64_t Pipeline::documents_emitted() const noexcept { return p_->emitted.load(); }
std::size_t Pipeline::workers() const noexcept { return p_->workers; }
std::size_t Pipeline::window() const noexcept { return p_->window; }

}

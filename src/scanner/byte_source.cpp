#include "delim_ingest/byte_source.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace di {

FileSource::FileSource(std::string path) : path_(std::move(path)) {}

FileSource::~FileSource() {
  if (f_ && owned_) std::fclose(f_);
}

bool FileSource::open() {
  if (f_) return true;
  if (path_ == "-") { f_ = stdin; owned_ = false; return true; }
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) { last_errno_ = errno ? errno : EIO; return false; }
  owned_ = true;
  return true;
}

std::size_t FileSource::read(char* buf, std::size_t n) {
  if (!f_ && !open()) return 0;
  std::size_t got = std::fread(buf, 1, n, f_);
  if (got == 0 && std::ferror(f_)) last_errno_ = errno ? errno : EIO;
  return got;
}

std::string FileSource::error() const {
  if (last_errno_ == 0) return {};
  return path_ + ": " + std::strerror(last_errno_);
}

std::size_t StringSource::read(char* buf, std::size_t n) {
  if (step_ > 0) n = std::min(n, step_);
  std::size_t left = data_.size() - pos_;
  std::size_t take = std::min(n, left);
  if (take) std::memcpy(buf, data_.data() + pos_, take);
  pos_ += take;
  return take;
}

std::size_t SizeTrackingSource::read(char* buf, std::size_t n) {
  std::size_t got = inner_.read(buf, n);
  bytes_.fetch_add(got, std::memory_order_relaxed);
  return got;
}

}

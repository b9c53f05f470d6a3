#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace di {

// Pull-style byte stream. read() returns the number of bytes copied into
// `buf`; 0 means end of input or failure, told apart by failed().
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::size_t read(char* buf, std::size_t n) = 0;
  virtual bool failed() const noexcept = 0;
  virtual std::string error() const { return {}; }
};

// Reads a file by path, or stdin when the path is "-".
class FileSource : public ByteSource {
public:
  explicit FileSource(std::string path);
  ~FileSource() override;
  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  bool open();
  std::size_t read(char* buf, std::size_t n) override;
  bool failed() const noexcept override { return last_errno_ != 0; }
  std::string error() const override;
  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  bool owned_{false};
  int last_errno_{0};
};

// In-memory source; `step` caps bytes per read() to exercise chunk seams.
class StringSource : public ByteSource {
public:
  explicit StringSource(std::string data, std::size_t step = 0)
    : data_(std::move(data)), step_(step) {}

  std::size_t read(char* buf, std::size_t n) override;
  bool failed() const noexcept override { return false; }

private:
  std::string data_;
  std::size_t pos_{0};
  std::size_t step_{0};
};

// Wraps another source and counts every byte pulled through it.
class SizeTrackingSource : public ByteSource {
public:
  explicit SizeTrackingSource(ByteSource& inner) : inner_(inner) {}

  std::size_t read(char* buf, std::size_t n) override;
  bool failed() const noexcept override { return inner_.failed(); }
  std::string error() const override { return inner_.error(); }

  std::uint64_t size() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  ByteSource& inner_;
  std::atomic<std::uint64_t> bytes_{0};
};

}

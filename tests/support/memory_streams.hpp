#pragma once
#include "csvpipe/byte_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace cp_test {

// Serves `data` in reads of at most `max_read` bytes; optionally fails with
// EIO once `fail_at` bytes have been served.
class MemorySource : public cp::ByteSource {
public:
  explicit MemorySource(std::string data, std::size_t max_read = 0,
                        std::size_t fail_at = std::string::npos)
      : data_(std::move(data)), max_read_(max_read), fail_at_(fail_at) {}

  std::size_t read(char* buf, std::size_t n) override {
    if (pos_ >= fail_at_) { failed_ = true; return 0; }
    if (max_read_) n = std::min(n, max_read_);
    n = std::min({n, data_.size() - pos_, fail_at_ - pos_});
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return n;
  }
  bool failed() const noexcept override { return failed_; }
  int last_error() const noexcept override { return failed_ ? EIO : 0; }
  std::string name() const override { return "<memory>"; }

private:
  std::string data_;
  std::size_t pos_{0};
  std::size_t max_read_;
  std::size_t fail_at_;
  bool failed_{false};
};

class StringSink : public cp::ByteSink {
public:
  bool write(std::string_view b) override {
    if (fail_writes) return false;
    pending_.append(b.data(), b.size());
    return true;
  }
  bool flush() override { data.append(pending_); pending_.clear(); ++flushes; return true; }
  int last_error() const noexcept override { return fail_writes ? ENOSPC : 0; }
  std::string name() const override { return "<string>"; }

  std::string data;    // what reached the sink through flush()
  int flushes = 0;
  bool fail_writes = false;

private:
  std::string pending_;
};

}

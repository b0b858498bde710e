#include "csvpipe/byte_stream.hpp"
#include "csvpipe/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <new>
#include <utility>

namespace cp {

namespace {

std::string errno_text(int e) { return e ? std::strerror(e) : "unknown error"; }

std::unique_ptr<char[]> make_buffer(std::size_t n, const std::string& what, Error* err) {
  try {
    return std::unique_ptr<char[]>(new char[n]);
  } catch (const std::bad_alloc&) {
    fail(err, ErrorKind::Io, "cannot allocate a " + std::to_string(n) + " byte buffer for " + what);
    return nullptr;
  }
}

// The source/sink buffer is the only one: stdio hands each request to the OS.
bool unbuffer(FILE* f) { return std::setvbuf(f, nullptr, _IONBF, 0) == 0; }

// Refills its own buffer from the stdio stream, exactly `cap` bytes per fread.
class StdioSource : public ByteSource {
public:
  StdioSource(FILE* f, std::string name, std::unique_ptr<char[]> buf, std::size_t cap)
    : f_(f), name_(std::move(name)), buf_(std::move(buf)), cap_(cap) {}

  std::size_t read(char* out, std::size_t n) override {
    if (pos_ == len_) {
      if (eof_ || failed_) return 0;
      pos_ = 0;
      len_ = std::fread(buf_.get(), 1, cap_, f_);
      if (len_ < cap_) {
        // a short fread means end of stream or an error; the bytes it did get are served first
        if (std::ferror(f_)) { last_errno_ = errno; failed_ = true; }
        else eof_ = true;
      }
      if (len_ == 0) return 0;
    }
    const std::size_t k = std::min(n, len_ - pos_);
    std::memcpy(out, buf_.get() + pos_, k);
    pos_ += k;
    return k;
  }
  bool failed() const noexcept override { return failed_ && pos_ == len_; }
  int last_error() const noexcept override { return last_errno_; }
  std::string name() const override { return name_; }

protected:
  FILE* f_;

private:
  std::string name_;
  std::unique_ptr<char[]> buf_;
  std::size_t cap_;
  std::size_t pos_{0};
  std::size_t len_{0};
  int last_errno_{0};
  bool eof_{false};
  bool failed_{false};
};

class FileSource final : public StdioSource {
public:
  FileSource(FILE* f, std::string path, std::unique_ptr<char[]> buf, std::size_t cap)
    : StdioSource(f, std::move(path), std::move(buf), cap) {}
  ~FileSource() override { std::fclose(f_); }
};

class StdinSource final : public StdioSource {
public:
  StdinSource(std::unique_ptr<char[]> buf, std::size_t cap)
    : StdioSource(stdin, "<stdin>", std::move(buf), cap) {}
};

// Collects writes in its own `cap`-byte buffer; the stdio stream only sees a
// write when that buffer is full or on flush().
class StdioSink : public ByteSink {
public:
  StdioSink(FILE* f, std::string name, std::unique_ptr<char[]> buf, std::size_t cap)
    : f_(f), name_(std::move(name)), buf_(std::move(buf)), cap_(cap) {}

  bool write(std::string_view bytes) override {
    if (bytes.size() > cap_ - len_ && !drain()) return false;
    if (bytes.size() >= cap_) return put(bytes.data(), bytes.size());
    std::memcpy(buf_.get() + len_, bytes.data(), bytes.size());
    len_ += bytes.size();
    return true;
  }
  bool flush() override {
    if (!drain()) return false;
    if (std::fflush(f_) != 0) { last_errno_ = errno; return false; }
    return true;
  }
  int last_error() const noexcept override { return last_errno_; }
  std::string name() const override { return name_; }

protected:
  FILE* f_;

private:
  bool put(const char* p, std::size_t n) {
    if (std::fwrite(p, 1, n, f_) != n) { last_errno_ = errno; return false; }
    return true;
  }
  bool drain() {
    const std::size_t n = len_;
    len_ = 0;
    return n == 0 || put(buf_.get(), n);
  }

  std::string name_;
  std::unique_ptr<char[]> buf_;
  std::size_t cap_;
  std::size_t len_{0};
  int last_errno_{0};
};

class FileSink final : public StdioSink {
public:
  FileSink(FILE* f, std::string path, std::unique_ptr<char[]> buf, std::size_t cap)
    : StdioSink(f, std::move(path), std::move(buf), cap) {}
  // Callers flush() explicitly and check it; the close only releases the fd.
  ~FileSink() override { std::fclose(f_); }
};

class StdoutSink final : public StdioSink {
public:
  StdoutSink(std::unique_ptr<char[]> buf, std::size_t cap)
    : StdioSink(stdout, "<stdout>", std::move(buf), cap) {}
};

}

std::unique_ptr<ByteSource> open_input(const std::optional<std::string>& path,
                                       std::size_t buffer_size, Error* err) {
  const std::string what = path ? "'" + *path + "'" : std::string("stdin");
  auto buf = make_buffer(buffer_size, what, err);
  if (!buf) return nullptr;
  if (!path) {
    if (!unbuffer(stdin)) {
      fail(err, ErrorKind::Io, "cannot switch stdin to unbuffered reads");
      return nullptr;
    }
    return std::make_unique<StdinSource>(std::move(buf), buffer_size);
  }

  FILE* f = std::fopen(path->c_str(), "rb");
  if (!f) {
    fail(err, ErrorKind::Io, "cannot open input " + what + ": " + errno_text(errno));
    return nullptr;
  }
  if (!unbuffer(f)) {
    std::fclose(f);
    fail(err, ErrorKind::Io, "cannot switch " + what + " to unbuffered reads");
    return nullptr;
  }
  return std::make_unique<FileSource>(f, *path, std::move(buf), buffer_size);
}

std::unique_ptr<ByteSink> open_output(const std::optional<std::string>& path,
                                      std::size_t buffer_size, Error* err) {
  const std::string what = path ? "'" + *path + "'" : std::string("stdout");
  auto buf = make_buffer(buffer_size, what, err);
  if (!buf) return nullptr;
  if (!path) {
    if (!unbuffer(stdout)) {
      fail(err, ErrorKind::Io, "cannot switch stdout to unbuffered writes");
      return nullptr;
    }
    return std::make_unique<StdoutSink>(std::move(buf), buffer_size);
  }

  FILE* f = std::fopen(path->c_str(), "wb");
  if (!f) {
    fail(err, ErrorKind::Io, "cannot create output " + what + ": " + errno_text(errno));
    return nullptr;
  }
  if (!unbuffer(f)) {
    std::fclose(f);
    fail(err, ErrorKind::Io, "cannot switch " + what + " to unbuffered writes");
    return nullptr;
  }
  return std::make_unique<FileSink>(f, *path, std::move(buf), buffer_size);
}

}

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cp {

// Turns arbitrary byte blocks into newline-terminated lines. Only the
// unfinished tail of a block is carried over, so memory is bounded by
// max_record_bytes regardless of input size.
class LineSplitter {
public:
  struct Config {
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  // `truncated` is set when the line hit the guard; the remainder up to the
  // next newline is dropped. Return false to stop splitting.
  using LineCallback = std::function<bool(std::string_view line, bool truncated)>;

  LineSplitter();
  explicit LineSplitter(Config cfg);

  // Returns false if the callback asked to stop.
  bool feed(std::string_view block, const LineCallback& cb);

  // Emits the final line if the input did not end with a newline.
  bool finish(const LineCallback& cb);

  std::uint64_t bytes_fed() const noexcept { return bytes_; }

private:
  bool emit(std::string_view line, bool truncated, const LineCallback& cb);

  Config cfg_;
  std::string carry_;
  bool skipping_oversize_{false};
  std::uint64_t bytes_{0};
};

}

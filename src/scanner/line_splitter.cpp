#include "csvpipe/line_splitter.hpp"

namespace cp {

LineSplitter::LineSplitter() : LineSplitter(Config{}) {}

LineSplitter::LineSplitter(Config cfg) : cfg_(cfg) { carry_.reserve(256); }

bool LineSplitter::emit(std::string_view line, bool truncated, const LineCallback& cb) {
  if (cfg_.strip_cr && !truncated && !line.empty() && line.back() == '\r') line.remove_suffix(1);
  return cb(line, truncated);
}

bool LineSplitter::feed(std::string_view block, const LineCallback& cb) {
  bytes_ += block.size();
  std::size_t start = 0;
  while (start < block.size()) {
    const std::size_t pos = block.find('\n', start);
    const bool hit_nl = (pos != std::string_view::npos);
    std::string_view slice = hit_nl ? block.substr(start, pos - start)
                                    : block.substr(start);
    start = hit_nl ? pos + 1 : block.size();

    if (skipping_oversize_) {
      // Keep discarding until newline
      if (hit_nl) skipping_oversize_ = false;
      continue;
    }

    if (carry_.size() + slice.size() > cfg_.max_record_bytes) {
      // Report what fits, drop the rest of this line.
      carry_.append(slice.substr(0, cfg_.max_record_bytes - carry_.size()));
      const bool go_on = emit(carry_, true, cb);
      carry_.clear();
      skipping_oversize_ = !hit_nl;
      if (!go_on) return false;
      continue;
    }

    if (!hit_nl) {
      carry_.append(slice);
      break;
    }

    // We have a full line
    bool go_on;
    if (!carry_.empty()) {
      carry_.append(slice);
      go_on = emit(carry_, false, cb);
      carry_.clear();
    } else {
      go_on = emit(slice, false, cb);
    }
    if (!go_on) return false;
  }
  return true;
}

bool LineSplitter::finish(const LineCallback& cb) {
  skipping_oversize_ = false;
  if (carry_.empty()) return true;
  const bool go_on = emit(carry_, false, cb);
  carry_.clear();
  return go_on;
}

}

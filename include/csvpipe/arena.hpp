#pragma once
#include <cstddef>
#include <vector>

namespace cp {

// Bump allocator for row storage. Growing the buffer moves it, so callers
// either reserve() a row's full size up front or address their bytes by
// offset from data() until the row is complete.
class Arena {
public:
  explicit Arena(std::size_t cap_bytes = 0);

  char* alloc(std::size_t n);
  void reserve(std::size_t n);

  // Gives the last `n` allocated bytes back.
  void unalloc(std::size_t n) noexcept;

  // Reset head to zero; capacity stays (reuse buffer).
  void reset() noexcept;

  const char* data() const noexcept { return buf_.data(); }
  std::size_t used() const noexcept { return head_; }
  std::size_t high_water() const noexcept { return high_water_; }

private:
  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t high_water_{0};
};

}

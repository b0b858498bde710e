#include "csvpipe/arena.hpp"
#include <algorithm>

namespace cp {

Arena::Arena(std::size_t cap_bytes) : buf_(cap_bytes), head_(0), high_water_(0) {}

void Arena::reserve(std::size_t n) {
  const std::size_t need = head_ + n;
  if (need > buf_.size()) buf_.resize(std::max(need, buf_.size() + buf_.size() / 2 + 1));
}

char* Arena::alloc(std::size_t n) {
  reserve(n);
  char* p = buf_.data() + head_;
  head_ += n;
  if (head_ > high_water_) high_water_ = head_;
  return p;
}

void Arena::unalloc(std::size_t n) noexcept { head_ -= std::min(n, head_); }

void Arena::reset() noexcept { head_ = 0; }

}

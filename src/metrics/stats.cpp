#include "csvpipe/stats.hpp"

namespace cp {

ProcessingStats::ProcessingStats() noexcept : start_(std::chrono::steady_clock::now()) {}

std::chrono::duration<double> ProcessingStats::elapsed() const noexcept {
  return std::chrono::steady_clock::now() - start_;
}

double ProcessingStats::rate(std::uint64_t count, double seconds) noexcept {
  // NaN compares false, so it falls through to 0 as well
  if (!(seconds > 0.0)) return 0.0;
  return static_cast<double>(count) / seconds;
}

double ProcessingStats::records_per_second() const noexcept {
  return rate(records(), elapsed().count());
}

double ProcessingStats::bytes_per_second() const noexcept {
  return rate(bytes(), elapsed().count());
}

}

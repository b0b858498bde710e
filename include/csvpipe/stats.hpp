#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace cp {

// Run-scoped counters. Every member may be called from any thread.
class ProcessingStats {
public:
  ProcessingStats() noexcept;

  void set_records(std::uint64_t n) noexcept { records_.store(n, std::memory_order_relaxed); }
  void add_records(std::uint64_t n) noexcept { records_.fetch_add(n, std::memory_order_relaxed); }
  void set_bytes(std::uint64_t n) noexcept { bytes_.store(n, std::memory_order_relaxed); }
  void add_bytes(std::uint64_t n) noexcept { bytes_.fetch_add(n, std::memory_order_relaxed); }

  std::uint64_t records() const noexcept { return records_.load(std::memory_order_relaxed); }
  std::uint64_t bytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

  std::chrono::duration<double> elapsed() const noexcept;
  double records_per_second() const noexcept;
  double bytes_per_second() const noexcept;

  // count / seconds, or 0 when seconds is not positive.
  static double rate(std::uint64_t count, double seconds) noexcept;

private:
  std::atomic<std::uint64_t> records_{0};
  std::atomic<std::uint64_t> bytes_{0};
  const std::chrono::steady_clock::time_point start_;
};

}

#include "csvpipe/stats.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

static int failures = 0;
static void check(bool cond, const char* what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main(){
  // rates never divide by a non-positive duration
  check(cp::ProcessingStats::rate(100, 0.0) == 0.0, "zero seconds");
  check(cp::ProcessingStats::rate(100, -1.5) == 0.0, "negative seconds");
  check(cp::ProcessingStats::rate(100, std::numeric_limits<double>::quiet_NaN()) == 0.0, "NaN seconds");
  check(cp::ProcessingStats::rate(100, 2.0) == 50.0, "100 over 2s");

  cp::ProcessingStats s;
  check(s.records() == 0 && s.bytes() == 0, "starts at zero");
  check(std::isfinite(s.records_per_second()) && std::isfinite(s.bytes_per_second()), "fresh rates finite");

  s.set_records(10);
  s.add_records(5);
  s.set_bytes(100);
  s.add_bytes(28);
  check(s.records() == 15, "set then add records");
  check(s.bytes() == 128, "set then add bytes");
  s.set_records(3);
  check(s.records() == 3, "set overrides");

  // concurrent adds from several threads lose nothing
  cp::ProcessingStats shared;
  constexpr int kThreads = 4;
  constexpr int kAdds = 100000;
  std::vector<std::thread> pool;
  for (int t = 0; t < kThreads; ++t) {
    pool.emplace_back([&] {
      for (int i = 0; i < kAdds; ++i) { shared.add_records(1); shared.add_bytes(3); }
    });
  }
  for (auto& th : pool) th.join();
  check(shared.records() == std::uint64_t(kThreads) * kAdds, "concurrent records");
  check(shared.bytes() == std::uint64_t(kThreads) * kAdds * 3, "concurrent bytes");
  check(shared.elapsed().count() >= 0.0, "elapsed non-negative");
  check(shared.records_per_second() >= 0.0, "rate non-negative");

  if (failures) return 1;
  std::cout << "[PASS] stats\n";
  return 0;
}

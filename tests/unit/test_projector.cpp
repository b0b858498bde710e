#include "csvpipe/projector.hpp"
#include <iostream>
#include <string_view>
#include <vector>

using sv_vec = std::vector<std::string_view>;

static int failures = 0;
static void check(bool cond, const char* what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main(){
  // 1-based -> 0-based, 0 clamps instead of wrapping
  check(cp::to_zero_based({1, 3, 2}) == std::vector<std::size_t>({0, 2, 1}), "to_zero_based order");
  check(cp::to_zero_based({0, 1}) == std::vector<std::size_t>({0, 0}), "to_zero_based clamps 0");
  check(cp::to_zero_based({}).empty(), "to_zero_based empty");

  const sv_vec row = {"a", "b", "c"};
  sv_vec out;

  cp::project(row, {0, 2}, out);
  check(out == sv_vec({"a", "c"}), "select 1,3");

  cp::project(row, {2, 0, 0}, out);
  check(out == sv_vec({"c", "a", "a"}), "reorder with duplicates");

  // short row: out-of-range offsets are dropped, never padded
  cp::project({"1", "2"}, {0, 2, 1}, out);
  check(out == sv_vec({"1", "2"}), "short row shrinks");

  cp::project(row, {4}, out);
  check(out.empty(), "all offsets out of range");

  // out is cleared between calls
  out = {"stale"};
  cp::project(row, {1}, out);
  check(out == sv_vec({"b"}), "output cleared");

  if (failures) return 1;
  std::cout << "[PASS] projector\n";
  return 0;
}

#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace cp {

// 1-based column indices -> 0-based offsets. 0 clamps to 0.
std::vector<std::size_t> to_zero_based(const std::vector<std::size_t>& indices);

// Picks fields by offset in the given order; duplicates repeat the field and
// offsets past the end of the row are skipped. `out` is cleared first.
void project(const std::vector<std::string_view>& fields,
             const std::vector<std::size_t>& offsets,
             std::vector<std::string_view>& out);

}

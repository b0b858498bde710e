#include "csvpipe/projector.hpp"

namespace cp {

std::vector<std::size_t> to_zero_based(const std::vector<std::size_t>& indices) {
  std::vector<std::size_t> out;
  out.reserve(indices.size());
  for (std::size_t i : indices) out.push_back(i > 0 ? i - 1 : 0);
  return out;
}

void project(const std::vector<std::string_view>& fields,
             const std::vector<std::size_t>& offsets,
             std::vector<std::string_view>& out) {
  out.clear();
  for (std::size_t off : offsets) {
    if (off < fields.size()) out.push_back(fields[off]);
  }
}

}

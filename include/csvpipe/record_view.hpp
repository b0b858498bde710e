#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace cp {

// Lightweight view over one parsed row. Valid until the parser moves on to
// the next row; copy what has to outlive that.
class RecordView {
public:
  RecordView() = default;
  explicit RecordView(const std::vector<std::string_view>* fields) : fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }
  const std::vector<std::string_view>* fields() const noexcept { return fields_; }

private:
  const std::vector<std::string_view>* fields_{nullptr};
};

}

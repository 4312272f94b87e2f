#pragma once
#include <string_view>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace dc {

// Lightweight view over one parsed record. Fields are unquoted/unescaped
// logical values; the view is invalidated by the reader's next call.
class RecordView {
public:
  RecordView() = default;
  RecordView(std::uint64_t ordinal, std::uint64_t line,
             const std::vector<std::string_view>* fields)
      : ordinal_(ordinal), line_(line), fields_(fields) {}

  std::size_t size() const noexcept { return fields_ ? fields_->size() : 0; }

  // Get field by index.
  std::string_view at(std::size_t i) const {
    return (fields_ && i < fields_->size()) ? (*fields_)[i] : std::string_view{};
  }

  // 0-based position of the record in the input.
  std::uint64_t ordinal() const noexcept { return ordinal_; }
  // Physical line (1-based) the record started on.
  std::uint64_t line() const noexcept { return line_; }

private:
  std::uint64_t ordinal_{0};
  std::uint64_t line_{0};
  const std::vector<std::string_view>* fields_{nullptr};
};

}

#pragma once

#include <cassert>
#include <cstddef>
#include <string_view>

namespace zcjson {

// Non-owning byte range [start, end) into a source buffer.
// The buffer must outlive the slice.
class slice {
public:
  constexpr slice() noexcept = default;
  constexpr slice(const char* source, std::size_t start, std::size_t end) noexcept
      : source_(source), start_(start), end_(end) {}

  constexpr const char* source() const noexcept { return source_; }
  constexpr std::size_t start() const noexcept { return start_; }
  constexpr std::size_t end() const noexcept { return end_; }
  constexpr std::size_t size() const noexcept { return end_ - start_; }
  constexpr bool empty() const noexcept { return start_ == end_; }

  // Reinterprets the bytes as text. No UTF-8 validation is done.
  std::string_view as_text() const noexcept {
    if (source_ == nullptr) return std::string_view{};
    return std::string_view(source_ + start_, end_ - start_);
  }

  friend constexpr bool operator==(const slice& a, const slice& b) noexcept {
    return a.source_ == b.source_ && a.start_ == b.start_ && a.end_ == b.end_;
  }
  friend constexpr bool operator!=(const slice& a, const slice& b) noexcept { return !(a == b); }

private:
  const char* source_{nullptr};
  std::size_t start_{0};
  std::size_t end_{0};
};

// Immutable view over the whole input text. Hands out slices; bounds are the
// caller's responsibility.
class source_view {
public:
  constexpr source_view() noexcept = default;
  constexpr explicit source_view(std::string_view text) noexcept : data_(text.data()), size_(text.size()) {}

  constexpr const char* data() const noexcept { return data_; }
  constexpr std::size_t size() const noexcept { return size_; }
  constexpr std::string_view text() const noexcept { return std::string_view(data_, size_); }

  char at(std::size_t i) const noexcept {
    assert(i < size_);
    return data_[i];
  }

  zcjson::slice slice(std::size_t start, std::size_t end) const noexcept {
    assert(start <= end && end <= size_);
    return zcjson::slice(data_, start, end);
  }

private:
  const char* data_{nullptr};
  std::size_t size_{0};
};

} // namespace zcjson

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <zcjson/escape.hpp>
#include <zcjson/number.hpp>
#include <zcjson/source_view.hpp>

namespace zcjson {

// Read-only node of a parsed tree. Scalars reference the source buffer;
// containers own their children. Missing keys/indices yield the shared
// absent() sentinel, so lookups can be chained without checks.
class value {
public:
  using array = std::pmr::vector<value>;
  using member = std::pair<std::string_view, value>;
  // Members sorted by raw key text, unique keys.
  using object = std::pmr::vector<member>;

  enum class kind { absent, null, boolean, number, string, object, array };

  value() noexcept = default;

  static const value& absent() noexcept {
    static const value sentinel;
    return sentinel;
  }

  static value make_null(slice span) noexcept {
    value v;
    v.span_ = span;
    v.data_.emplace<1>(nullptr);
    return v;
  }

  static value make_boolean(bool b, slice span) noexcept {
    value v;
    v.span_ = span;
    v.data_.emplace<2>(b);
    return v;
  }

  static value make_number(const zcjson::number& n, slice span) noexcept {
    value v;
    v.span_ = span;
    v.data_.emplace<3>(n);
    return v;
  }

  // `span` excludes the quotes.
  static value make_string(slice span) noexcept {
    value v;
    v.span_ = span;
    v.data_.emplace<4>(span.as_text());
    return v;
  }

  static value make_object(std::pmr::memory_resource* mr) {
    value v;
    v.data_.emplace<5>(mr);
    return v;
  }

  static value make_array(std::pmr::memory_resource* mr) {
    value v;
    v.data_.emplace<6>(mr);
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 1: return kind::null;
      case 2: return kind::boolean;
      case 3: return kind::number;
      case 4: return kind::string;
      case 5: return kind::object;
      case 6: return kind::array;
      default: return kind::absent;
    }
  }

  bool exists() const noexcept { return data_.index() != 0; }
  bool is_null() const noexcept { return data_.index() == 1; }
  bool is_bool() const noexcept { return data_.index() == 2; }
  bool is_number() const noexcept { return data_.index() == 3; }
  bool is_string() const noexcept { return data_.index() == 4; }
  bool is_object() const noexcept { return data_.index() == 5; }
  bool is_array() const noexcept { return data_.index() == 6; }

  bool is_integer() const noexcept {
    const auto* n = std::get_if<3>(&data_);
    return n != nullptr && n->is_integer;
  }

  // Source range: inside the quotes for strings, brackets included for
  // containers, empty for absent.
  const slice& span() const noexcept { return span_; }
  std::string_view raw() const noexcept { return span_.as_text(); }

  std::optional<bool> as_boolean() const noexcept {
    if (const auto* b = std::get_if<2>(&data_)) return *b;
    return std::nullopt;
  }

  std::optional<zcjson::number> as_number() const noexcept {
    if (const auto* n = std::get_if<3>(&data_)) return *n;
    return std::nullopt;
  }

  std::optional<int128> as_integer() const noexcept {
    const auto* n = std::get_if<3>(&data_);
    if (n == nullptr || !n->is_integer) return std::nullopt;
    return n->mantissa;
  }

  std::optional<std::int64_t> as_int64() const noexcept {
    const auto* n = std::get_if<3>(&data_);
    if (n == nullptr || !n->fits_int64()) return std::nullopt;
    return n->to_int64();
  }

  std::optional<double> as_float() const noexcept {
    if (const auto* n = std::get_if<3>(&data_)) return n->float_value;
    return std::nullopt;
  }

  // Raw text between the quotes; escapes are left as written.
  std::optional<std::string_view> as_string() const noexcept {
    if (const auto* s = std::get_if<4>(&data_)) return *s;
    return std::nullopt;
  }

  // Allocating variant of as_string() with escapes decoded.
  std::optional<std::string> unescaped() const {
    const auto* s = std::get_if<4>(&data_);
    if (s == nullptr) return std::nullopt;
    return zcjson::unescape(*s);
  }

  const value* find(std::string_view key) const noexcept {
    const auto* o = std::get_if<5>(&data_);
    if (o == nullptr) return nullptr;
    auto it = std::lower_bound(o->begin(), o->end(), key,
                               [](const member& m, std::string_view k) { return m.first < k; });
    if (it == o->end() || it->first != key) return nullptr;
    return &it->second;
  }

  const value& operator[](std::string_view key) const noexcept {
    const value* v = find(key);
    return v ? *v : absent();
  }

  const value& operator[](std::size_t index) const noexcept {
    const auto* a = std::get_if<6>(&data_);
    if (a == nullptr || index >= a->size()) return absent();
    return (*a)[index];
  }

  // Object members in key order; empty for anything else.
  const object& entries() const noexcept {
    if (const auto* o = std::get_if<5>(&data_)) return *o;
    return empty_object();
  }

  // Array elements in source order; empty for anything else.
  const array& elements() const noexcept {
    if (const auto* a = std::get_if<6>(&data_)) return *a;
    return empty_array();
  }

  std::size_t size() const noexcept {
    if (const auto* o = std::get_if<5>(&data_)) return o->size();
    if (const auto* a = std::get_if<6>(&data_)) return a->size();
    return 0;
  }

private:
  // index: 0 absent, 1 null, 2 bool, 3 number, 4 string, 5 object, 6 array
  std::variant<std::monostate, std::nullptr_t, bool, zcjson::number, std::string_view, object, array> data_;
  slice span_;

  static const object& empty_object() noexcept {
    static const object empty;
    return empty;
  }

  static const array& empty_array() noexcept {
    static const array empty;
    return empty;
  }

  object& mutable_object() noexcept { return *std::get_if<5>(&data_); }
  array& mutable_array() noexcept { return *std::get_if<6>(&data_); }

  friend struct parser;
};

namespace detail {

// Sorts members by key; for repeated keys the last occurrence is kept.
inline void sort_members(value::object& o) {
  std::stable_sort(o.begin(), o.end(),
                   [](const value::member& a, const value::member& b) { return a.first < b.first; });
  std::size_t w = 0;
  for (std::size_t r = 0; r < o.size(); ++r) {
    if (r + 1 < o.size() && o[r + 1].first == o[r].first) continue;
    if (w != r) o[w] = std::move(o[r]);
    ++w;
  }
  o.erase(o.begin() + static_cast<std::ptrdiff_t>(w), o.end());
}

} // namespace detail

} // namespace zcjson

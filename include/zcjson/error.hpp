#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace zcjson {

enum class error_code {
  ok = 0,
  unexpected_eof,
  invalid_value,
  invalid_root,
  invalid_number,
  numeric_overflow,
  number_out_of_range,
  invalid_string,
  invalid_escape,
  invalid_unicode_escape,
  invalid_utf16_surrogate,
  expected_colon,
  expected_comma_or_end,
  expected_key_string,
  trailing_characters,
  nesting_too_deep
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::unexpected_eof: return "unexpected end of input";
    case error_code::invalid_value: return "invalid value";
    case error_code::invalid_root: return "top-level value must be an object or array";
    case error_code::invalid_number: return "invalid number";
    case error_code::numeric_overflow: return "integer does not fit in 128 bits";
    case error_code::number_out_of_range: return "number out of double range";
    case error_code::invalid_string: return "invalid string";
    case error_code::invalid_escape: return "invalid escape";
    case error_code::invalid_unicode_escape: return "invalid \\u escape";
    case error_code::invalid_utf16_surrogate: return "unpaired UTF-16 surrogate";
    case error_code::expected_colon: return "expected ':'";
    case error_code::expected_comma_or_end: return "expected ',' or closing bracket";
    case error_code::expected_key_string: return "expected string key";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::nesting_too_deep: return "nesting too deep";
  }
  return "unknown error";
}

// A parse failure. `offset` is the byte at which scanning could not proceed;
// line and column are 1-based and derived from it.
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e)
      : std::runtime_error(std::string("zcjson: ") + to_string(e.code) + " at offset " + std::to_string(e.offset)),
        err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

} // namespace detail

} // namespace zcjson

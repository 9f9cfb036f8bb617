#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include <zcjson/error.hpp>

#if !defined(__SIZEOF_INT128__)
  #error "zcjson: a compiler with __int128 support is required"
#endif

namespace zcjson {

__extension__ typedef __int128 int128;
__extension__ typedef unsigned __int128 uint128;

// Decoded numeric literal.
// `mantissa` is every retained digit of the literal (integer part followed by
// fraction part), sign applied, so the exact decimal value is
// mantissa * 10^(exponent - fraction_digits).
// If `is_integer == false`, `float_value` is the authoritative value.
struct number {
  int128 mantissa{0};
  double float_value{0.0};
  bool is_integer{true};
  std::int32_t fraction_digits{0};
  std::int32_t exponent{0};

  bool fits_int64() const noexcept {
    return is_integer && mantissa >= static_cast<int128>(std::numeric_limits<std::int64_t>::min()) &&
           mantissa <= static_cast<int128>(std::numeric_limits<std::int64_t>::max());
  }

  std::int64_t to_int64() const noexcept { return static_cast<std::int64_t>(mantissa); }
};

namespace detail {

constexpr int128 int128_max = static_cast<int128>(~static_cast<uint128>(0) >> 1);
constexpr int128 int128_min = -int128_max - 1;

// Exponent scale table, 10^0 .. 10^64. Entries up to 10^22 are exact doubles.
inline constexpr double positive_powers_of_ten[65] = {
    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11, 1e12,
    1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22, 1e23, 1e24, 1e25,
    1e26, 1e27, 1e28, 1e29, 1e30, 1e31, 1e32, 1e33, 1e34, 1e35, 1e36, 1e37, 1e38,
    1e39, 1e40, 1e41, 1e42, 1e43, 1e44, 1e45, 1e46, 1e47, 1e48, 1e49, 1e50, 1e51,
    1e52, 1e53, 1e54, 1e55, 1e56, 1e57, 1e58, 1e59, 1e60, 1e61, 1e62, 1e63, 1e64};

// Decimal scale table, 10^-0 .. 10^-64. Indexed by fraction digit count.
inline constexpr double negative_powers_of_ten[65] = {
    1e-0,  1e-1,  1e-2,  1e-3,  1e-4,  1e-5,  1e-6,  1e-7,  1e-8,  1e-9,  1e-10, 1e-11, 1e-12,
    1e-13, 1e-14, 1e-15, 1e-16, 1e-17, 1e-18, 1e-19, 1e-20, 1e-21, 1e-22, 1e-23, 1e-24, 1e-25,
    1e-26, 1e-27, 1e-28, 1e-29, 1e-30, 1e-31, 1e-32, 1e-33, 1e-34, 1e-35, 1e-36, 1e-37, 1e-38,
    1e-39, 1e-40, 1e-41, 1e-42, 1e-43, 1e-44, 1e-45, 1e-46, 1e-47, 1e-48, 1e-49, 1e-50, 1e-51,
    1e-52, 1e-53, 1e-54, 1e-55, 1e-56, 1e-57, 1e-58, 1e-59, 1e-60, 1e-61, 1e-62, 1e-63, 1e-64};

constexpr std::int32_t scale_table_max = 64;
constexpr std::int32_t max_exact_power = 22;
constexpr std::int32_t exponent_saturation = 100000;

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// Appends one decimal digit to a magnitude; false if the result would
// exceed `limit`.
inline bool push_digit(uint128& acc, unsigned d, uint128 limit) noexcept {
  if (acc > (limit - d) / 10) return false;
  acc = acc * 10 + d;
  return true;
}

// Applies the sign to a magnitude no larger than 2^127.
inline int128 signed_magnitude(uint128 mag, bool neg) noexcept {
  if (!neg) return static_cast<int128>(mag);
  if (mag == 0) return 0;
  return -static_cast<int128>(mag - 1) - 1;
}

inline double fraction_to_double(int128 frac, std::int32_t digits) noexcept {
  const double f = static_cast<double>(frac);
  if (digits <= max_exact_power) return f / positive_powers_of_ten[digits];
  return f * negative_powers_of_ten[digits];
}

} // namespace detail

// v * 10^e using only the scale tables. Exponents past the table are applied
// 10^64 at a time.
inline double scale_by_power_of_ten(double v, std::int32_t e) noexcept {
  using detail::scale_table_max;
  if (e >= 0) {
    while (e > scale_table_max) {
      v *= detail::positive_powers_of_ten[scale_table_max];
      e -= scale_table_max;
      if (v == 0.0 || std::isinf(v)) return v;
    }
    return v * detail::positive_powers_of_ten[e];
  }
  while (e < -scale_table_max) {
    v *= detail::negative_powers_of_ten[scale_table_max];
    e += scale_table_max;
    if (v == 0.0) return v;
  }
  if (-e <= detail::max_exact_power) return v / detail::positive_powers_of_ten[-e];
  return v * detail::negative_powers_of_ten[-e];
}

namespace detail {

// JSON number grammar:
// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
// On failure `i` is left at the offending byte (the literal start for
// number_out_of_range).
inline error_code parse_number(const char* buf, std::size_t size, std::size_t& i, number& out) noexcept {
  const std::size_t start = i;

  bool neg = false;
  if (i < size && buf[i] == '-') {
    neg = true;
    ++i;
  }
  if (i >= size) return error_code::unexpected_eof;

  // Magnitudes; the sign is applied once the literal is complete. A negative
  // literal may reach 2^127.
  const uint128 limit = static_cast<uint128>(int128_max) + (neg ? 1u : 0u);
  uint128 int_part = 0;
  if (buf[i] == '0') {
    ++i;
    if (i < size && is_digit(buf[i])) return error_code::invalid_number;
  } else if (is_digit(buf[i])) {
    while (i < size && is_digit(buf[i])) {
      if (!push_digit(int_part, static_cast<unsigned>(buf[i] - '0'), limit)) return error_code::numeric_overflow;
      ++i;
    }
  } else {
    return error_code::invalid_number;
  }

  uint128 mantissa = int_part;
  uint128 frac = 0;
  std::int32_t frac_digits = 0;
  bool is_integer = true;

  if (i < size && buf[i] == '.') {
    is_integer = false;
    ++i;
    if (i >= size) return error_code::unexpected_eof;
    if (!is_digit(buf[i])) return error_code::invalid_number;
    std::int32_t significant = 0;
    bool saturated = false;
    while (i < size && is_digit(buf[i])) {
      const unsigned d = static_cast<unsigned>(buf[i] - '0');
      if (mantissa == 0 && d == 0) {
        // Zeros ahead of the first significant digit only shift the scale.
        if (frac_digits < exponent_saturation) ++frac_digits;
      } else if (!saturated) {
        uint128 m = mantissa;
        uint128 f = frac;
        if (significant < scale_table_max && push_digit(m, d, limit) &&
            push_digit(f, d, static_cast<uint128>(int128_max))) {
          mantissa = m;
          frac = f;
          ++frac_digits;
          ++significant;
        } else {
          // 64 significant digits are kept; the rest are below double precision.
          saturated = true;
        }
      }
      ++i;
    }
  }

  std::int32_t exponent = 0;
  if (i < size && (buf[i] == 'e' || buf[i] == 'E')) {
    is_integer = false;
    ++i;
    bool exp_neg = false;
    if (i < size && (buf[i] == '+' || buf[i] == '-')) {
      exp_neg = (buf[i] == '-');
      ++i;
    }
    if (i >= size) return error_code::unexpected_eof;
    if (!is_digit(buf[i])) return error_code::invalid_number;
    while (i < size && is_digit(buf[i])) {
      if (exponent < exponent_saturation) exponent = exponent * 10 + (buf[i] - '0');
      ++i;
    }
    if (exp_neg) exponent = -exponent;
  }

  double value = 0.0;
  if (int_part == 0) {
    // Pure fraction: scale once so leading zeros and the exponent cancel.
    value = static_cast<double>(frac);
    if (value != 0.0) value = scale_by_power_of_ten(value, exponent - frac_digits);
  } else {
    value = static_cast<double>(int_part);
    if (frac_digits > 0) value += fraction_to_double(static_cast<int128>(frac), frac_digits);
    if (exponent != 0) value = scale_by_power_of_ten(value, exponent);
  }
  if (!std::isfinite(value)) {
    i = start;
    return error_code::number_out_of_range;
  }
  if (neg) value = -value;

  out.mantissa = signed_magnitude(mantissa, neg);
  out.float_value = value;
  out.is_integer = is_integer;
  out.fraction_digits = frac_digits;
  out.exponent = exponent;
  return error_code::ok;
}

inline error_code parse_number(std::string_view s, std::size_t& i, number& out) noexcept {
  return parse_number(s.data(), s.size(), i, out);
}

} // namespace detail

} // namespace zcjson

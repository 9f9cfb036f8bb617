#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory_resource>
#include <string_view>
#include <utility>

#include <zcjson/config.hpp>
#include <zcjson/error.hpp>
#include <zcjson/escape.hpp>
#include <zcjson/number.hpp>
#include <zcjson/source_view.hpp>
#include <zcjson/value.hpp>

#if ZCJSON_ENABLE_SSE2
  #if defined(_MSC_VER)
    #include <intrin.h>
  #endif
  #include <immintrin.h>
#endif

namespace zcjson {

struct parse_options {
  std::size_t max_depth{ZCJSON_DEFAULT_MAX_DEPTH};
  bool require_eof{true};
  // Accept a bare scalar (e.g. `42`) as the document root.
  bool allow_scalar_root{false};
};

struct parse_result {
  value val;
  error err;
};

namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline void skip_ws(const char* buf, std::size_t size, std::size_t& i) noexcept {
#if ZCJSON_ENABLE_SSE2
  // Most documents have short whitespace runs; only go wide on long ones.
  if (i + 16 <= size && is_ws(buf[i]) && is_ws(buf[i + 1])) {
    while (i + 16 <= size) {
      const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
      const __m128i is_space = _mm_cmpeq_epi8(v, _mm_set1_epi8(' '));
      const __m128i is_nl = _mm_cmpeq_epi8(v, _mm_set1_epi8('\n'));
      const __m128i is_cr = _mm_cmpeq_epi8(v, _mm_set1_epi8('\r'));
      const __m128i is_tab = _mm_cmpeq_epi8(v, _mm_set1_epi8('\t'));
      const __m128i is_ws_v = _mm_or_si128(_mm_or_si128(is_space, is_nl), _mm_or_si128(is_cr, is_tab));
      const unsigned non = (~static_cast<unsigned>(_mm_movemask_epi8(is_ws_v))) & 0xFFFFu;
      if (non == 0u) {
        i += 16;
        continue;
      }
#if defined(_MSC_VER)
      unsigned long idx = 0;
      _BitScanForward(&idx, non);
      i += static_cast<std::size_t>(idx);
#else
      i += static_cast<std::size_t>(__builtin_ctz(non));
#endif
      return;
    }
  }
#endif
  while (i < size && is_ws(buf[i])) ++i;
}

// Big-endian packing of up to four bytes, so a literal tail can be checked
// with a single integer compare.
constexpr std::uint32_t pack_bytes(const char* p, std::size_t n) noexcept {
  std::uint32_t v = 0;
  for (std::size_t k = 0; k < n; ++k) v = (v << 8) | static_cast<unsigned char>(p[k]);
  return v;
}

constexpr std::uint32_t null_tail = pack_bytes("ull", 3);
constexpr std::uint32_t true_tail = pack_bytes("rue", 3);
constexpr std::uint32_t false_tail = pack_bytes("alse", 4);

} // namespace detail

// Recursive-descent parser over one source buffer. One instance per parse;
// `i` is the only cursor.
struct parser {
  source_view src;
  const char* buf{nullptr};
  std::size_t size{0};
  std::size_t i{0};
  parse_options opt;
  std::pmr::memory_resource* mr{std::pmr::get_default_resource()};

  parser(std::string_view json, parse_options options = {}, std::pmr::memory_resource* resource = nullptr)
      : src(json), buf(json.data()), size(json.size()), opt(options) {
    if (resource != nullptr) mr = resource;
  }

  parse_result run() {
    parse_result r;
    r.err = run_into(r.val);
    return r;
  }

  // On failure `out` is left absent.
  error run_into(value& out) {
    error err;
    i = 0;
    detail::skip_ws(buf, size, i);
    if (i >= size) {
      set_error(err, error_code::unexpected_eof);
      return err;
    }

    value root;
    const char c = buf[i];
    if (c == '{') {
      root = parse_object(1, err);
    } else if (c == '[') {
      root = parse_array(1, err);
    } else if (opt.allow_scalar_root) {
      root = parse_value(0, err);
    } else {
      set_error(err, error_code::invalid_root);
      return err;
    }
    if (err) return err;

    detail::skip_ws(buf, size, i);
    if (opt.require_eof && i != size) {
      set_error(err, error_code::trailing_characters);
      return err;
    }
    out = std::move(root);
    return err;
  }

  void set_error(error& e, error_code code, std::size_t at = std::numeric_limits<std::size_t>::max()) {
    if (e) return;
    e.code = code;
    e.offset = (at == std::numeric_limits<std::size_t>::max()) ? i : at;
    detail::update_line_col(src.text(), e.offset, e.line, e.column);
  }

  value parse_value(std::size_t depth, error& e) {
    if (i >= size) {
      set_error(e, error_code::unexpected_eof);
      return value();
    }

    switch (buf[i]) {
      case 'n': return parse_literal(detail::null_tail, 3, e);
      case 't': return parse_literal(detail::true_tail, 3, e);
      case 'f': return parse_literal(detail::false_tail, 4, e);
      case '"': {
        slice s;
        if (!parse_string(s, e)) return value();
        return value::make_string(s);
      }
      case '{': return parse_object(depth + 1, e);
      case '[': return parse_array(depth + 1, e);
      case '-':
      case '0': case '1': case '2': case '3': case '4':
      case '5': case '6': case '7': case '8': case '9': return parse_number(e);
      default:
        set_error(e, error_code::invalid_value);
        return value();
    }
  }

  // Leading byte already identified the literal; compare the packed tail.
  value parse_literal(std::uint32_t tail, std::size_t tail_len, error& e) {
    const std::size_t start = i;
    if (start + 1 + tail_len > size) {
      // Truncated: only end of input if what is there is a prefix of the tail.
      const std::size_t avail = size - start - 1;
      const bool prefix = avail == 0 ||
                          detail::pack_bytes(buf + start + 1, avail) == (tail >> (8 * (tail_len - avail)));
      if (prefix) {
        set_error(e, error_code::unexpected_eof, size);
      } else {
        set_error(e, error_code::invalid_value, start);
      }
      return value();
    }
    if (detail::pack_bytes(buf + start + 1, tail_len) != tail) {
      set_error(e, error_code::invalid_value, start);
      return value();
    }
    i = start + 1 + tail_len;
    const slice span = src.slice(start, i);
    if (tail == detail::null_tail) return value::make_null(span);
    return value::make_boolean(tail == detail::true_tail, span);
  }

  value parse_number(error& e) {
    const std::size_t start = i;
    number n;
    const error_code ec = detail::parse_number(buf, size, i, n);
    if (ec != error_code::ok) {
      set_error(e, ec);
      return value();
    }
    return value::make_number(n, src.slice(start, i));
  }

  // `out` spans the bytes between the quotes. The cursor ends past the
  // closing quote.
  bool parse_string(slice& out, error& e) {
    ++i; // '"'
    const std::size_t start = i;

    while (true) {
#if ZCJSON_ENABLE_SSE2
      {
        const __m128i q = _mm_set1_epi8('"');
        const __m128i bs = _mm_set1_epi8('\\');
        const __m128i k1f = _mm_set1_epi8(0x1F);
        const __m128i zero = _mm_setzero_si128();
        while (i + 16 <= size) {
          const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(buf + i));
          const __m128i is_q = _mm_cmpeq_epi8(v, q);
          const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
          const __m128i sub = _mm_subs_epu8(v, k1f);
          const __m128i is_ctrl = _mm_cmpeq_epi8(sub, zero);
          const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), is_ctrl);
          const int mask = _mm_movemask_epi8(any);
          if (mask == 0) {
            i += 16;
            continue;
          }
#if defined(_MSC_VER)
          unsigned long bit = 0;
          _BitScanForward(&bit, static_cast<unsigned long>(mask));
          i += static_cast<std::size_t>(bit);
#else
          i += static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
          break;
        }
      }
#endif
      if (i >= size) {
        set_error(e, error_code::unexpected_eof, size);
        return false;
      }

      const char c = buf[i];
      if (c == '"') {
        out = src.slice(start, i);
        ++i;
        return true;
      }
      if (c == '\\') {
        // The escape is consumed whole, so an escaped backslash can never
        // be mistaken for the start of another escape.
        ++i;
        std::uint32_t cp = 0;
        const error_code ec = detail::read_escape(buf, size, i, cp);
        if (ec != error_code::ok) {
          set_error(e, ec, ec == error_code::unexpected_eof ? size : i);
          return false;
        }
        continue;
      }
      if (static_cast<unsigned char>(c) <= 0x1F) {
        set_error(e, error_code::invalid_string, i);
        return false;
      }
      ++i;
    }
  }

  value parse_array(std::size_t depth, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep);
      return value();
    }
    const std::size_t start = i;
    ++i; // '['
    value out = value::make_array(mr);
    auto& a = out.mutable_array();

    detail::skip_ws(buf, size, i);
    if (i < size && buf[i] == ']') {
      ++i;
      out.span_ = src.slice(start, i);
      return out;
    }

    while (true) {
      value elem = parse_value(depth, e);
      if (e) return value();
      a.emplace_back(std::move(elem));

      detail::skip_ws(buf, size, i);
      if (i >= size) {
        set_error(e, error_code::unexpected_eof);
        return value();
      }
      const char c = buf[i++];
      if (c == ',') {
        detail::skip_ws(buf, size, i);
        continue;
      }
      if (c == ']') {
        out.span_ = src.slice(start, i);
        return out;
      }
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return value();
    }
  }

  value parse_object(std::size_t depth, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep);
      return value();
    }
    const std::size_t start = i;
    ++i; // '{'
    value out = value::make_object(mr);
    auto& o = out.mutable_object();

    detail::skip_ws(buf, size, i);
    if (i < size && buf[i] == '}') {
      ++i;
      out.span_ = src.slice(start, i);
      return out;
    }

    while (true) {
      if (i >= size) {
        set_error(e, error_code::unexpected_eof);
        return value();
      }
      if (buf[i] != '"') {
        set_error(e, error_code::expected_key_string);
        return value();
      }
      slice key;
      if (!parse_string(key, e)) return value();

      detail::skip_ws(buf, size, i);
      if (i >= size) {
        set_error(e, error_code::unexpected_eof);
        return value();
      }
      if (buf[i] != ':') {
        set_error(e, error_code::expected_colon);
        return value();
      }
      ++i;

      detail::skip_ws(buf, size, i);
      value v = parse_value(depth, e);
      if (e) return value();
      o.emplace_back(key.as_text(), std::move(v));

      detail::skip_ws(buf, size, i);
      if (i >= size) {
        set_error(e, error_code::unexpected_eof);
        return value();
      }
      const char c = buf[i++];
      if (c == ',') {
        detail::skip_ws(buf, size, i);
        continue;
      }
      if (c == '}') {
        detail::sort_members(o);
        out.span_ = src.slice(start, i);
        return out;
      }
      set_error(e, error_code::expected_comma_or_end, i - 1);
      return value();
    }
  }
};

// Parses a JSON document whose root is an object or array. The returned tree
// borrows `json`, which must outlive it.
inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parser p(json, opt);
  return p.run();
}

inline value parse_or_throw(std::string_view json, parse_options opt = {}) {
  auto r = parse(json, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

} // namespace zcjson

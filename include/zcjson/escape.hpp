#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <zcjson/error.hpp>

namespace zcjson {
namespace detail {

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline bool parse_u4(const char* buf, std::size_t size, std::size_t& i, std::uint32_t& out_cp) noexcept {
  if (i + 4 > size) return false;
  const int h0 = hex_val(buf[i]);
  const int h1 = hex_val(buf[i + 1]);
  const int h2 = hex_val(buf[i + 2]);
  const int h3 = hex_val(buf[i + 3]);
  if ((h0 | h1 | h2 | h3) < 0) return false;
  out_cp = (static_cast<std::uint32_t>(h0) << 12) |
           (static_cast<std::uint32_t>(h1) << 8) |
           (static_cast<std::uint32_t>(h2) << 4) |
           static_cast<std::uint32_t>(h3);
  i += 4;
  return true;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Reads one escape sequence. `i` points just past the backslash and is left
// past the sequence on success, at the offending byte on failure.
// `cp` receives the decoded code point (surrogate pairs combined).
inline error_code read_escape(const char* buf, std::size_t size, std::size_t& i, std::uint32_t& cp) noexcept {
  if (i >= size) return error_code::unexpected_eof;
  const char esc = buf[i];
  switch (esc) {
    case '"': cp = '"'; break;
    case '\\': cp = '\\'; break;
    case '/': cp = '/'; break;
    case 'b': cp = '\b'; break;
    case 'f': cp = '\f'; break;
    case 'n': cp = '\n'; break;
    case 'r': cp = '\r'; break;
    case 't': cp = '\t'; break;
    case 'u': {
      ++i;
      if (!parse_u4(buf, size, i, cp)) return error_code::invalid_unicode_escape;
      if (cp >= 0xD800u && cp <= 0xDBFFu) {
        if (i + 2 > size || buf[i] != '\\' || buf[i + 1] != 'u') return error_code::invalid_utf16_surrogate;
        i += 2;
        std::uint32_t low = 0;
        if (!parse_u4(buf, size, i, low)) return error_code::invalid_unicode_escape;
        if (low < 0xDC00u || low > 0xDFFFu) return error_code::invalid_utf16_surrogate;
        cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
      } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
        return error_code::invalid_utf16_surrogate;
      }
      return error_code::ok;
    }
    default:
      return error_code::invalid_escape;
  }
  ++i;
  return error_code::ok;
}

} // namespace detail

// Decodes the escapes of a raw string span (quotes already stripped).
inline std::optional<std::string> unescape(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  const char* buf = raw.data();
  const std::size_t n = raw.size();
  std::size_t i = 0;
  std::size_t chunk_begin = 0;
  while (i < n) {
    if (buf[i] != '\\') {
      ++i;
      continue;
    }
    if (i > chunk_begin) out.append(buf + chunk_begin, i - chunk_begin);
    ++i;
    std::uint32_t cp = 0;
    if (detail::read_escape(buf, n, i, cp) != error_code::ok) return std::nullopt;
    detail::append_utf8(out, cp);
    chunk_begin = i;
  }
  if (i > chunk_begin) out.append(buf + chunk_begin, i - chunk_begin);
  return out;
}

} // namespace zcjson

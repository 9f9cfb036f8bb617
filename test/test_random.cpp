#include "test_common.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace zcjson;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

// Expected tree, built first and then written out as JSON text.
struct node {
  enum class type { null_, boolean, integer, decimal, string, array, object };
  type t{type::null_};
  bool b{false};
  std::int64_t i{0};
  double d{0.0};
  std::string s;
  std::vector<std::string> keys;
  std::vector<node> children;
};

std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t k = 0; k < len; ++k) {
    switch (r.next_u32() % 16u) {
      case 0: out.push_back('"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('\t'); break;
      case 4: out.push_back('\x01'); break;
      case 5: out.append("\xC3\xA9"); break; // U+00E9
      default: out.push_back(static_cast<char>(' ' + (r.next_u32() % 95u))); break;
    }
  }
  return out;
}

std::string random_key(rng& r, std::size_t index) {
  static const char alnum[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::string key = "k" + std::to_string(index) + "_";
  const std::size_t len = r.range(6);
  for (std::size_t k = 0; k < len; ++k) key.push_back(alnum[r.range(sizeof(alnum) - 1)]);
  return key;
}

node random_node(rng& r, int depth);

node random_container(rng& r, int depth, bool object) {
  node n;
  n.t = object ? node::type::object : node::type::array;
  const std::size_t count = r.range(8);
  for (std::size_t k = 0; k < count; ++k) {
    if (object) n.keys.push_back(random_key(r, k));
    n.children.push_back(random_node(r, depth - 1));
  }
  return n;
}

node random_node(rng& r, int depth) {
  const std::uint32_t pick = r.next_u32() % (depth <= 0 ? 5u : 7u);
  node n;
  switch (pick) {
    case 0: n.t = node::type::null_; break;
    case 1:
      n.t = node::type::boolean;
      n.b = r.coin();
      break;
    case 2:
      n.t = node::type::integer;
      n.i = static_cast<std::int64_t>(r.next_u64());
      break;
    case 3:
      n.t = node::type::decimal;
      n.i = static_cast<std::int64_t>(r.next_u32() % 2000000u) - 1000000;
      break;
    case 4:
      n.t = node::type::string;
      n.s = random_string(r, 20);
      break;
    case 5: return random_container(r, depth, false);
    default: return random_container(r, depth, true);
  }
  return n;
}

void write_ws(rng& r, std::string& out) {
  static const char ws[] = {' ', '\n', '\r', '\t'};
  const std::size_t n = (r.next_u32() % 4u == 0u) ? r.range(20) : 0;
  for (std::size_t k = 0; k < n; ++k) out.push_back(ws[r.range(4)]);
}

void write_string(const std::string& s, rng& r, std::string& out) {
  out.push_back('"');
  for (const char c : s) {
    switch (c) {
      case '"': out.append("\\\""); break;
      case '\\': out.append("\\\\"); break;
      case '\n': out.append(r.coin() ? "\\n" : "\\u000a"); break;
      case '\t': out.append("\\t"); break;
      case '\x01': out.append("\\u0001"); break;
      case '/': out.append(r.coin() ? "\\/" : "/"); break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
}

void write_decimal(std::int64_t thousandths, std::string& out) {
  const std::int64_t mag = thousandths < 0 ? -thousandths : thousandths;
  char frac[4];
  std::snprintf(frac, sizeof(frac), "%03d", static_cast<int>(mag % 1000));
  if (thousandths < 0) out.push_back('-');
  out += std::to_string(mag / 1000);
  out.push_back('.');
  out += frac;
}

void write_node(const node& n, rng& r, std::string& out) {
  switch (n.t) {
    case node::type::null_: out += "null"; return;
    case node::type::boolean: out += n.b ? "true" : "false"; return;
    case node::type::integer: out += std::to_string(n.i); return;
    case node::type::decimal: write_decimal(n.i, out); return;
    case node::type::string: write_string(n.s, r, out); return;
    case node::type::array:
    case node::type::object: {
      const bool object = n.t == node::type::object;
      out.push_back(object ? '{' : '[');
      for (std::size_t k = 0; k < n.children.size(); ++k) {
        if (k) out.push_back(',');
        write_ws(r, out);
        if (object) {
          write_string(n.keys[k], r, out);
          write_ws(r, out);
          out.push_back(':');
          write_ws(r, out);
        }
        write_node(n.children[k], r, out);
        write_ws(r, out);
      }
      out.push_back(object ? '}' : ']');
      return;
    }
  }
}

void deep_equal(const node& expected, const value& v) {
  switch (expected.t) {
    case node::type::null_: ZCJSON_CHECK(v.is_null()); return;
    case node::type::boolean: ZCJSON_CHECK(v.as_boolean() == expected.b); return;
    case node::type::integer:
      ZCJSON_CHECK(v.is_integer());
      ZCJSON_CHECK(*v.as_integer() == static_cast<int128>(expected.i));
      ZCJSON_CHECK(*v.as_int64() == expected.i);
      return;
    case node::type::decimal: {
      ZCJSON_CHECK(v.is_number() && !v.is_integer());
      const number n = *v.as_number();
      ZCJSON_CHECK(n.fraction_digits == 3);
      ZCJSON_CHECK(n.mantissa == static_cast<int128>(expected.i));
      ZCJSON_CHECK(zcjson_test::nearly_equal(n.float_value, static_cast<double>(expected.i) / 1000.0, 1e-12, 1e-15));
      return;
    }
    case node::type::string: {
      const auto s = v.unescaped();
      ZCJSON_CHECK(s.has_value());
      ZCJSON_CHECK(*s == expected.s);
      return;
    }
    case node::type::array: {
      ZCJSON_CHECK(v.is_array());
      ZCJSON_CHECK(v.size() == expected.children.size());
      for (std::size_t k = 0; k < expected.children.size(); ++k) deep_equal(expected.children[k], v[k]);
      return;
    }
    case node::type::object: {
      ZCJSON_CHECK(v.is_object());
      ZCJSON_CHECK(v.size() == expected.children.size());
      for (std::size_t k = 0; k < expected.children.size(); ++k) {
        const value* m = v.find(expected.keys[k]);
        ZCJSON_CHECK(m != nullptr);
        deep_equal(expected.children[k], *m);
      }
      const auto& members = v.entries();
      for (std::size_t k = 1; k < members.size(); ++k) ZCJSON_CHECK(members[k - 1].first < members[k].first);
      return;
    }
  }
}

} // namespace

void test_random() {
  rng r;
  document reused;
  // Deterministic pseudo-fuzz: generate expected trees, write them out, parse, and compare.
  for (int iter = 0; iter < 2000; ++iter) {
    const node expected = random_container(r, 4, r.coin());
    std::string json;
    write_node(expected, r, json);

    auto pr = parse(json);
    ZCJSON_CHECK(!pr.err);
    deep_equal(expected, pr.val);
    ZCJSON_CHECK(pr.val.raw() == json);

    ZCJSON_CHECK(!parse_into(reused, json));
    deep_equal(expected, reused.root());

    // Every proper prefix is unbalanced and must fail inside the input.
    const std::size_t cut = r.range(json.size());
    const std::string prefix = json.substr(0, cut);
    auto bad = parse(prefix);
    ZCJSON_CHECK(static_cast<bool>(bad.err));
    ZCJSON_CHECK(bad.err.offset <= prefix.size());
    ZCJSON_CHECK(!bad.val.exists());
  }
}

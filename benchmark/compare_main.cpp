#include <zcjson/zcjson.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <json/json.h>

#include <rapidjson/document.h>

// zcjson against nlohmann/json, jsoncpp and RapidJSON on two inputs: a ledger
// of records with 128-bit ids and escaped memos, and a flat array of numbers
// that exercises long and zero-led fractions.
//
// usage: zcjson_compare [records] [iters] [runs]

namespace {

using clock_type = std::chrono::steady_clock;

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

// xorshift64; deterministic across platforms, unlike <random> distributions.
struct xorshift {
  std::uint64_t s;
  std::uint64_t next() {
    s ^= s << 13;
    s ^= s >> 7;
    s ^= s << 17;
    return s;
  }
};

std::string ledger_payload(std::size_t records) {
  xorshift rng{0x9e3779b97f4a7c15ull};
  std::string s = "{\"ledger\":[";
  for (std::size_t k = 0; k < records; ++k) {
    if (k) s += ',';
    // 20 to 38 digit ids: past 64 bits, still exact in 128.
    s += "{\"id\":";
    s += std::to_string(1 + rng.next() % 9);
    const std::size_t extra = 19 + rng.next() % 19;
    for (std::size_t d = 0; d < extra; ++d) s += static_cast<char>('0' + rng.next() % 10);
    s += ",\"amount\":";
    s += std::to_string(rng.next() % 100000);
    s += '.';
    s += std::to_string(10 + rng.next() % 90);
    s += ",\"memo\":\"ref ";
    s += std::to_string(k);
    if (k % 8 == 0) s += " \\\"held\\\" \\u00e9\\ud83d\\ude00";
    s += "\",\"settled\":";
    s += (k % 3 == 0) ? "false" : "true";
    s += ",\"parent\":";
    s += (k % 5 == 0) ? "null" : std::to_string(k / 2);
    s += '}';
  }
  s += "]}";
  return s;
}

std::string numbers_payload(std::size_t count) {
  xorshift rng{42};
  std::string s = "[";
  for (std::size_t k = 0; k < count; ++k) {
    if (k) s += ',';
    const std::string digits = std::to_string(rng.next() % 1000000000ull);
    switch (k % 4) {
      case 0: s += "0.000000" + digits; break;
      case 1: s += "-" + digits + "." + digits + digits; break;
      case 2: s += digits + "e-" + std::to_string(rng.next() % 300); break;
      default: s += "0." + digits + digits + digits + "e" + std::to_string(rng.next() % 200); break;
    }
  }
  s += ']';
  return s;
}

// Median seconds of `runs` timed loops of `iters` calls each.
template <class Fn>
double median_seconds(std::size_t runs, std::size_t iters, Fn&& fn) {
  std::vector<double> secs;
  for (std::size_t r = 0; r < std::max<std::size_t>(runs, 1); ++r) {
    const auto t0 = clock_type::now();
    for (std::size_t i = 0; i < iters; ++i) fn();
    secs.push_back(std::chrono::duration<double>(clock_type::now() - t0).count());
  }
  std::nth_element(secs.begin(), secs.begin() + secs.size() / 2, secs.end());
  return secs[secs.size() / 2];
}

void report(const char* name, std::size_t bytes, std::size_t iters, double seconds) {
  const double mib = static_cast<double>(bytes * iters) / (1024.0 * 1024.0);
  std::cout << "  " << name << ": " << (seconds > 0.0 ? mib / seconds : 0.0) << " MiB/s\n";
}

double zcjson_sum(const zcjson::value& arr) {
  double sum = 0.0;
  for (const zcjson::value& v : arr.elements()) sum += *v.as_float();
  return sum;
}

double rapidjson_sum(const rapidjson::Document& d) {
  double sum = 0.0;
  for (const auto& v : d.GetArray()) sum += v.GetDouble();
  return sum;
}

std::unique_ptr<Json::CharReader> strict_jsoncpp_reader() {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["allowComments"] = false;
  builder["allowTrailingCommas"] = false;
  builder["strictRoot"] = true;
  return std::unique_ptr<Json::CharReader>(builder.newCharReader());
}

void compare_parsers(const char* title, const std::string& text, std::size_t iters, std::size_t runs) {
  std::cout << "\n== " << title << " (" << text.size() << " bytes) ==\n";

  zcjson::pmr::arena_resource arena;
  arena.reserve_bytes(text.size() * 4u);
  report("zcjson", text.size(), iters, median_seconds(runs, iters, [&] {
           arena.clear();
           zcjson::parser p(text, zcjson::parse_options{}, &arena);
           const auto r = p.run();
           do_not_optimize(r.err.code);
         }));

  report("nlohmann", text.size(), iters, median_seconds(runs, iters, [&] {
           const auto j = nlohmann::json::parse(text, nullptr, false);
           do_not_optimize(j.is_discarded());
         }));

  const auto reader = strict_jsoncpp_reader();
  report("jsoncpp", text.size(), iters, median_seconds(runs, iters, [&] {
           Json::Value root;
           std::string errs;
           const bool ok = reader->parse(text.data(), text.data() + text.size(), &root, &errs);
           do_not_optimize(ok);
         }));

  report("rapidjson", text.size(), iters, median_seconds(runs, iters, [&] {
           rapidjson::Document d;
           d.Parse(text.data(), text.size());
           do_not_optimize(d.HasParseError());
         }));
}

// Sums every number with zcjson and RapidJSON and prints the relative gap, so
// a regression in the scaling path shows up next to the timings.
bool check_float_agreement(const std::string& text) {
  const auto ours = zcjson::parse(text);
  rapidjson::Document theirs;
  theirs.Parse(text.data(), text.size());
  if (ours.err || theirs.HasParseError() || !theirs.IsArray()) {
    std::cerr << "numbers payload rejected: " << zcjson::to_string(ours.err.code) << " at offset "
              << ours.err.offset << "\n";
    return false;
  }
  const double a = zcjson_sum(ours.val);
  const double b = rapidjson_sum(theirs);
  const double gap = std::fabs(a - b) / std::fmax(std::fabs(b), 1e-300);
  std::cout << "  sum zcjson=" << a << " rapidjson=" << b << " relative gap=" << gap << "\n";
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::size_t records = 2000;
  std::size_t iters = 100;
  std::size_t runs = 5;
  if (argc >= 2) records = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  std::cout << "sizeof(zcjson::value): " << sizeof(zcjson::value) << "\n";
  std::cout << "sizeof(rapidjson::Value): " << sizeof(rapidjson::Value) << "\n";

  const std::string ledger = ledger_payload(records);
  const std::string numbers = numbers_payload(records * 16);

  const auto parsed = zcjson::parse(ledger);
  if (parsed.err) {
    std::cerr << "ledger payload rejected: " << zcjson::to_string(parsed.err.code) << "\n";
    return 1;
  }
  std::cout << "ledger records: " << parsed.val["ledger"].size() << "\n";

  compare_parsers("ledger", ledger, iters, runs);
  compare_parsers("numbers", numbers, iters, runs);

  std::cout << "\n== numbers agreement ==\n";
  return check_float_agreement(numbers) ? 0 : 1;
}

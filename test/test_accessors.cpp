#include "test_common.hpp"

#include <string>
#include <vector>

using namespace zcjson;

static void test_absent_chains() {
  auto r = parse(R"({"a":{"b":[10,20]}})");
  ZCJSON_CHECK(!r.err);
  const value& v = r.val;

  ZCJSON_CHECK(*v["a"]["b"][1].as_integer() == 20);

  const value& missing = v["missing"]["x"][0];
  ZCJSON_CHECK(!missing.exists());
  ZCJSON_CHECK(missing.type() == value::kind::absent);
  ZCJSON_CHECK(!missing.as_integer().has_value());
  ZCJSON_CHECK(!missing.as_string().has_value());
  ZCJSON_CHECK(&missing == &value::absent());

  ZCJSON_CHECK(!v["a"]["b"][2].exists());
  ZCJSON_CHECK(!v["a"]["b"]["key"].exists());
  ZCJSON_CHECK(!v["a"][0].exists());
  ZCJSON_CHECK(!v["a"]["b"][0]["deeper"].exists());
}

static void test_type_mismatches_are_empty() {
  auto r = parse(R"({"s":"text","i":5,"f":2.5,"b":true,"n":null,"big":100000000000000000000})");
  ZCJSON_CHECK(!r.err);
  const value& v = r.val;

  ZCJSON_CHECK(!v["s"].as_integer().has_value());
  ZCJSON_CHECK(!v["s"].as_number().has_value());
  ZCJSON_CHECK(!v["s"].as_boolean().has_value());
  ZCJSON_CHECK(!v["i"].as_string().has_value());
  ZCJSON_CHECK(!v["i"].unescaped().has_value());
  ZCJSON_CHECK(!v["b"].as_float().has_value());
  ZCJSON_CHECK(!v["n"].as_boolean().has_value());

  // Fractional numbers are not integers but still have a float.
  ZCJSON_CHECK(!v["f"].as_integer().has_value());
  ZCJSON_CHECK(!v["f"].as_int64().has_value());
  ZCJSON_CHECK(*v["f"].as_float() == 2.5);
  ZCJSON_CHECK(!v["f"].is_integer());

  // Integers always expose a float.
  ZCJSON_CHECK(v["i"].is_integer());
  ZCJSON_CHECK(*v["i"].as_float() == 5.0);
  ZCJSON_CHECK(*v["i"].as_int64() == 5);

  // Exact past 64 bits, so as_int64 is empty.
  ZCJSON_CHECK(v["big"].as_integer().has_value());
  ZCJSON_CHECK(!v["big"].as_int64().has_value());
  ZCJSON_CHECK(zcjson_test::nearly_equal(*v["big"].as_float(), 1e20));
}

static void test_kinds() {
  auto r = parse(R"([null,false,0,"",{},[]])");
  ZCJSON_CHECK(!r.err);
  const value::kind expected[] = {value::kind::null,   value::kind::boolean, value::kind::number,
                                  value::kind::string, value::kind::object,  value::kind::array};
  for (std::size_t k = 0; k < 6; ++k) {
    ZCJSON_CHECK(r.val[k].type() == expected[k]);
    ZCJSON_CHECK(r.val[k].exists());
  }
  ZCJSON_CHECK(r.val.type() == value::kind::array);
}

static void test_traversal_on_non_containers() {
  auto r = parse(R"({"s":"x","o":{"k":1},"a":[1,2]})");
  ZCJSON_CHECK(!r.err);
  const value& s = r.val["s"];

  ZCJSON_CHECK(s.size() == 0);
  ZCJSON_CHECK(s.entries().empty());
  ZCJSON_CHECK(s.elements().empty());
  ZCJSON_CHECK(s.find("k") == nullptr);

  ZCJSON_CHECK(r.val["o"].elements().empty());
  ZCJSON_CHECK(r.val["a"].entries().empty());
  ZCJSON_CHECK(value::absent().entries().empty());
  ZCJSON_CHECK(value::absent().size() == 0);
}

static void test_find_and_iteration() {
  auto r = parse(R"({"one":1,"two":[true,false],"three":{}})");
  ZCJSON_CHECK(!r.err);

  const value* two = r.val.find("two");
  ZCJSON_CHECK(two != nullptr);
  ZCJSON_CHECK(two->is_array());
  ZCJSON_CHECK(r.val.find("four") == nullptr);
  ZCJSON_CHECK(r.val.find("") == nullptr);
  ZCJSON_CHECK(r.val["two"].find("0") == nullptr);

  std::vector<std::string> keys;
  for (const auto& m : r.val.entries()) keys.emplace_back(m.first);
  ZCJSON_CHECK(keys.size() == 3);
  ZCJSON_CHECK(keys[0] == "one");
  ZCJSON_CHECK(keys[1] == "three");
  ZCJSON_CHECK(keys[2] == "two");

  std::size_t trues = 0;
  for (const value& e : two->elements()) {
    if (*e.as_boolean()) ++trues;
  }
  ZCJSON_CHECK(trues == 1);
}

static void test_values_are_copyable() {
  const std::string json = R"({"a":[1,{"b":"c"}]})";
  auto r = parse(json);
  ZCJSON_CHECK(!r.err);

  value copy = r.val["a"];
  ZCJSON_CHECK(copy.size() == 2);
  ZCJSON_CHECK(*copy[1]["b"].as_string() == "c");
  // Copied strings still reference the parsed text.
  ZCJSON_CHECK(copy[1]["b"].as_string()->data() == r.val["a"][1]["b"].as_string()->data());
}

static void test_parse_or_throw() {
  const std::string ok = R"({"n":3})";
  const value v = parse_or_throw(ok);
  ZCJSON_CHECK(*v["n"].as_integer() == 3);

  ZCJSON_EXPECT_THROW(parse_or_throw("{\"n\":}"));

  try {
    (void)parse_or_throw("[1 2]");
    ZCJSON_CHECK(false);
  } catch (const parse_error& e) {
    ZCJSON_CHECK(e.err().code == error_code::expected_comma_or_end);
    ZCJSON_CHECK(e.err().offset == 3);
  }
}

void test_accessors() {
  test_absent_chains();
  test_type_mismatches_are_empty();
  test_kinds();
  test_traversal_on_non_containers();
  test_find_and_iteration();
  test_values_are_copyable();
  test_parse_or_throw();
}

#include <jb/errors.hpp>
#include <jb/json_reader.hpp>
#include <jb/json_value.hpp>
#include <jb/json_writer.hpp>

#include <catch2/catch.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

using namespace jb;

// ---------------------------------------------------------------------------
// json_value
// ---------------------------------------------------------------------------

TEST_CASE("json_value kinds", "[json]") {
  CHECK(json_value().is_null());
  CHECK(json_value(nullptr).kind() == json_kind::null);
  CHECK(json_value(true).is_bool());
  CHECK(json_value(3).is_integer());
  CHECK(json_value(2.5).kind() == json_kind::floating);
  CHECK(json_value(2.5).is_number());
  CHECK(json_value("text").is_string());
  CHECK(json_value(json_array{}).is_array());
  CHECK(json_value(json_object{}).is_object());
}

TEST_CASE("json_value accessors check the kind", "[json]") {
  CHECK(json_value(7).as_integer() == 7);
  CHECK(json_value(7).as_double() == 7.0);
  CHECK(json_value(4.0).as_integer() == 4);
  CHECK(json_value("x").as_string() == "x");

  try {
    json_value("x").as_integer();
    FAIL("expected type_mismatch");
  } catch (const decode_error& e) {
    CHECK(e.kind() == decode_error_kind::type_mismatch);
  }
  CHECK_THROWS_AS(json_value(4.5).as_integer(), decode_error);
  CHECK_THROWS_AS(json_value(1).as_string(), decode_error);
  CHECK_THROWS_AS(json_value().as_object(), decode_error);
}

TEST_CASE("json_value as_integer rejects numbers out of range", "[json]") {
  CHECK(json_value(-9223372036854775808.0).as_integer() ==
        std::numeric_limits<std::int64_t>::min());
  CHECK_THROWS_AS(json_value(1e300).as_integer(), decode_error);
  CHECK_THROWS_AS(json_value(-1e300).as_integer(), decode_error);
  CHECK_THROWS_AS(json_value(9223372036854775808.0).as_integer(),
                  decode_error);
  CHECK_THROWS_AS(
      json_value(std::numeric_limits<double>::quiet_NaN()).as_integer(),
      decode_error);
  CHECK_THROWS_AS(
      json_value(std::numeric_limits<double>::infinity()).as_integer(),
      decode_error);
  CHECK_THROWS_AS(json_value(std::uint64_t{18446744073709551615u}).as_integer(),
                  decode_error);
}

TEST_CASE("json_value as_unsigned rejects negatives", "[json]") {
  CHECK(json_value(0).as_unsigned() == 0u);
  CHECK(json_value(12.0).as_unsigned() == 12u);
  CHECK(json_value(std::uint64_t{18446744073709551615u}).as_unsigned() ==
        18446744073709551615u);

  try {
    json_value(-5).as_unsigned();
    FAIL("expected type_mismatch");
  } catch (const decode_error& e) {
    CHECK(e.kind() == decode_error_kind::type_mismatch);
  }
  CHECK_THROWS_AS(json_value(-0.5).as_unsigned(), decode_error);
  CHECK_THROWS_AS(json_value(1e30).as_unsigned(), decode_error);
  CHECK_THROWS_AS(json_value(2.5).as_unsigned(), decode_error);
  CHECK_THROWS_AS(json_value("5").as_unsigned(), decode_error);
}

TEST_CASE("json_value small unsigned values are plain integers", "[json]") {
  json_value small(std::uint64_t{5});
  CHECK(small == json_value(5));
  CHECK_FALSE(small.is_unsigned());

  json_value large(std::uint64_t{9223372036854775808u});
  CHECK(large.is_integer());
  CHECK(large.is_unsigned());
  CHECK(large.as_double() == 9223372036854775808.0);
}

TEST_CASE("json_value find returns the first occurrence", "[json]") {
  json_value object(json_object{{"a", 1}, {"b", 2}, {"a", 3}});
  REQUIRE(object.find("a") != nullptr);
  CHECK(*object.find("a") == json_value(1));
  CHECK(object.find("c") == nullptr);
  CHECK(json_value(1).find("a") == nullptr);
}

TEST_CASE("json_value equality is structural", "[json]") {
  CHECK(json_value(json_array{1, "x"}) == json_value(json_array{1, "x"}));
  CHECK(json_value(1) != json_value(1.0));
  CHECK(json_value(json_object{{"a", 1}, {"b", 2}}) !=
        json_value(json_object{{"b", 2}, {"a", 1}}));
}

// ---------------------------------------------------------------------------
// parse_json
// ---------------------------------------------------------------------------

TEST_CASE("parse_json scalars", "[json][reader]") {
  CHECK(parse_json("null") == json_value(nullptr));
  CHECK(parse_json("true") == json_value(true));
  CHECK(parse_json("false") == json_value(false));
  CHECK(parse_json("42") == json_value(42));
  CHECK(parse_json("-7") == json_value(-7));
  CHECK(parse_json("2.5") == json_value(2.5));
  CHECK(parse_json("1e3") == json_value(1000.0));
  CHECK(parse_json("\"hello\"") == json_value("hello"));
}

TEST_CASE("parse_json quoted scalars stay strings", "[json][reader]") {
  CHECK(parse_json("\"42\"") == json_value("42"));
  CHECK(parse_json("\"true\"") == json_value("true"));
  CHECK(parse_json("\"null\"") == json_value("null"));
}

TEST_CASE("parse_json escapes", "[json][reader]") {
  CHECK(parse_json(R"("a\"b\\c\nd")") == json_value("a\"b\\c\nd"));
  CHECK(parse_json(R"("café")") == json_value("caf\xc3\xa9"));
}

TEST_CASE("parse_json containers keep document order", "[json][reader]") {
  auto value = parse_json(R"({"b": [1, 2.5, "x"], "a": {"c": null}})");
  REQUIRE(value.is_object());
  const auto& members = value.as_object();
  REQUIRE(members.size() == 2);
  CHECK(members[0].first == "b");
  CHECK(members[0].second == json_value(json_array{1, 2.5, "x"}));
  CHECK(members[1].first == "a");
  CHECK(members[1].second ==
        json_value(json_object{{"c", json_value(nullptr)}}));
}

TEST_CASE("parse_json keeps duplicate keys", "[json][reader]") {
  auto value = parse_json(R"({"name": "a", "name": "b"})");
  const auto& members = value.as_object();
  REQUIRE(members.size() == 2);
  CHECK(members[0].second == json_value("a"));
  CHECK(members[1].second == json_value("b"));
}

TEST_CASE("parse_json compact input", "[json][reader]") {
  CHECK(parse_json(R"({"a":1,"b":[true,false]})") ==
        json_value(json_object{{"a", 1}, {"b", json_array{true, false}}}));
  CHECK(parse_json("[]") == json_value(json_array{}));
  CHECK(parse_json("{}") == json_value(json_object{}));
}

TEST_CASE("parse_json rejects malformed text", "[json][reader]") {
  CHECK_THROWS_AS(parse_json(""), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\": 1"), parse_error);
  CHECK_THROWS_AS(parse_json("[1, 2"), parse_error);
  CHECK_THROWS_AS(parse_json("hello"), parse_error);
  CHECK_THROWS_AS(parse_json("{1: 2}"), parse_error);
}

TEST_CASE("parse_json rejects empty slots and missing values",
          "[json][reader]") {
  CHECK_THROWS_AS(parse_json("[1,,2]"), parse_error);
  CHECK_THROWS_AS(parse_json("[1,2,]"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\":}"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\":1,}"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\"}"), parse_error);
}

TEST_CASE("parse_json rejects trailing content", "[json][reader]") {
  CHECK_THROWS_AS(parse_json("{\"a\":1} {\"b\":2}"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\":1}\n---\n{}"), parse_error);
  CHECK_THROWS_AS(parse_json("1 2"), parse_error);
  CHECK(parse_json("  {\"a\": 1}\n") == json_value(json_object{{"a", 1}}));
}

TEST_CASE("parse_json rejects YAML-only syntax", "[json][reader]") {
  CHECK_THROWS_AS(parse_json("{\"a\": ~}"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\": Null}"), parse_error);
  CHECK_THROWS_AS(parse_json("{\"a\": True}"), parse_error);
  CHECK_THROWS_AS(parse_json("'x'"), parse_error);
  CHECK_THROWS_AS(parse_json("# note\n1"), parse_error);
  CHECK_THROWS_AS(parse_json("[1, 2] // done"), parse_error);
  CHECK_THROWS_AS(parse_json("- 1"), parse_error);
  CHECK_THROWS_AS(parse_json("a: 1"), parse_error);
  CHECK_THROWS_AS(parse_json("{a: 1}"), parse_error);
}

TEST_CASE("parse_json decodes surrogate pairs", "[json][reader]") {
  CHECK(parse_json(R"("\ud83d\ude00")") == json_value("\xF0\x9F\x98\x80"));
  CHECK(parse_json(R"("\u00e9")") == json_value("\xC3\xA9"));
  CHECK_THROWS_AS(parse_json(R"("\ud83d")"), parse_error);
  CHECK_THROWS_AS(parse_json(R"("\ude00")"), parse_error);
}

TEST_CASE("parse_json numbers beyond int64", "[json][reader]") {
  auto large = parse_json("18446744073709551615");
  CHECK(large.is_unsigned());
  CHECK(large.as_unsigned() == 18446744073709551615u);
  CHECK(to_json_string(large) == "18446744073709551615");

  CHECK(parse_json("9223372036854775807").as_integer() ==
        std::numeric_limits<std::int64_t>::max());
  CHECK(parse_json("-9223372036854775808").as_integer() ==
        std::numeric_limits<std::int64_t>::min());
  CHECK(parse_json("1e300").kind() == json_kind::floating);
}

TEST_CASE("parse_error carries a position", "[json][reader]") {
  try {
    parse_json("[1,\n 2,\n bogus]");
    FAIL("expected parse_error");
  } catch (const parse_error& e) {
    CHECK(e.line() == 3);
    CHECK(e.column() >= 1);
  }
}

// ---------------------------------------------------------------------------
// write_json
// ---------------------------------------------------------------------------

TEST_CASE("write_json compact output", "[json][writer]") {
  json_value value(json_object{
      {"id", "https://example.com/1"},
      {"n", 3},
      {"x", 2.0},
      {"ok", true},
      {"none", json_value(nullptr)},
      {"list", json_array{1, "a"}},
  });
  CHECK(to_json_string(value) ==
        R"({"id":"https://example.com/1","n":3,"x":2.0,"ok":true,)"
        R"("none":null,"list":[1,"a"]})");
}

TEST_CASE("write_json escapes strings", "[json][writer]") {
  CHECK(to_json_string(json_value("a\"b\\c\n\x01")) ==
        R"("a\"b\\c\n\u0001")");
}

TEST_CASE("write_json pretty output", "[json][writer]") {
  json_value value(json_object{{"a", json_array{1, 2}}, {"b", json_object{}}});
  CHECK(to_json_string(value, 2) ==
        "{\n  \"a\": [\n    1,\n    2\n  ],\n  \"b\": {}\n}");
}

TEST_CASE("write_json output reads back", "[json][writer]") {
  auto text = R"({"a":[1,2.5,"x",null,true],"b":{"c":"d"}})";
  CHECK(to_json_string(parse_json(text)) == text);

  std::ostringstream os;
  os << parse_json(text);
  CHECK(os.str() == text);
}

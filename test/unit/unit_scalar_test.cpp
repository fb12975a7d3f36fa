#include <jb/errors.hpp>
#include <jb/unit.hpp>

#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>

using namespace jb;

TEST_CASE("unit defaults to metres", "[unit]") {
  unit u;
  CHECK(u.which() == unit::kind::m);
  CHECK(u.to_string() == "m");
  CHECK(u.iri().empty());
}

TEST_CASE("unit names", "[unit]") {
  CHECK(unit("cm").which() == unit::kind::cm);
  CHECK(unit("feet").which() == unit::kind::feet);
  CHECK(unit("inches").which() == unit::kind::inches);
  CHECK(unit("km").which() == unit::kind::km);
  CHECK(unit("m").which() == unit::kind::m);
  CHECK(unit("miles").which() == unit::kind::miles);
  CHECK(unit("miles").to_string() == "miles");
}

TEST_CASE("unit IRIs", "[unit]") {
  unit u("http://qudt.org/vocab/unit/NanoM");
  CHECK(u.which() == unit::kind::iri);
  CHECK(u.iri() == "http://qudt.org/vocab/unit/NanoM");
  CHECK(u.to_string() == "http://qudt.org/vocab/unit/NanoM");
  CHECK(unit("urn:x-unit:parsec").which() == unit::kind::iri);

  std::ostringstream os;
  os << u;
  CHECK(os.str() == "http://qudt.org/vocab/unit/NanoM");
}

TEST_CASE("unit rejects other text", "[unit]") {
  CHECK_THROWS_AS(unit("Metres"), std::invalid_argument);
  CHECK_THROWS_AS(unit(""), std::invalid_argument);
  CHECK_THROWS_AS(unit(":nothing"), std::invalid_argument);
  CHECK_THROWS_AS(unit("1http://x"), std::invalid_argument);
}

TEST_CASE("unit codec", "[unit]") {
  CHECK(decode<unit>(json_value()) == unit());
  CHECK(decode<unit>(json_value("km")) == unit("km"));
  CHECK(encode(unit("feet")) == json_value("feet"));

  try {
    decode<unit>(json_value("parsecs"));
    FAIL("expected malformed_scalar");
  } catch (const decode_error& e) {
    CHECK(e.kind() == decode_error_kind::malformed_scalar);
    CHECK(e.subject() == "unit");
  }
  CHECK_THROWS_AS(decode<unit>(json_value(3)), decode_error);
}

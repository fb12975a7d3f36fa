// Bindings generated with --split: declarations in activity.hpp,
// definitions compiled from activity.cpp.

#include "activity.hpp"

#include <jb/json_reader.hpp>
#include <jb/json_writer.hpp>

#include <catch2/catch.hpp>

#include <variant>

using namespace jb;

TEST_CASE("split bindings decode and encode", "[split]") {
  auto json = parse_json(R"({
    "id": "https://e.x/n",
    "type": ["Note", "ex:Memo"],
    "content": "hello",
    "contentMap": {"en": "hello"}
  })");
  auto note = decode<activity_split::note>(json);
  CHECK(note.id == "https://e.x/n");
  CHECK(note.content.default_value == "hello");
  REQUIRE(note.type.size() == 2);

  auto encoded = encode(note);
  INFO(to_json_string(encoded));
  CHECK(decode<activity_split::note>(encoded) == note);
}

TEST_CASE("split bindings dispatch envelopes", "[split]") {
  auto value = decode<activity_split::object_variants>(parse_json(R"({
    "type": "Tombstone", "id": "https://e.x/gone",
    "deleted": "2016-03-17T00:00:00Z"
  })"));
  REQUIRE(std::holds_alternative<activity_split::tombstone>(value.value));
  CHECK(activity_split::object_id(value) == "https://e.x/gone");

  auto encoded = encode(value);
  CHECK(*encoded.find("type") == json_value("Tombstone"));
  CHECK(decode<activity_split::object_variants>(encoded) == value);
}

TEST_CASE("split bindings upcast", "[split]") {
  auto create = decode<activity_split::create>(parse_json(R"({
    "id": "https://e.x/c", "actor": "https://e.x/alice"
  })"));
  activity_split::activity act = activity_split::as_activity(create);
  CHECK(act.id == create.id);
  CHECK(act.actor == create.actor);

  activity_split::object object = activity_split::as_object(create);
  CHECK(object.id == "https://e.x/c");
}

TEST_CASE("split bindings report decode errors", "[split]") {
  try {
    decode<activity_split::link>(parse_json(R"({"rel": "me"})"));
    FAIL("expected a decode_error");
  } catch (const decode_error& e) {
    CHECK(e.kind() == decode_error_kind::missing_required_field);
    CHECK(e.subject() == "href");
  }
}

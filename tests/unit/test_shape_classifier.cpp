#include "json_table/errors.hpp"
#include "json_table/shape.hpp"

#include <simdjson.h>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

template <typename E>
static void expect_throw(const std::string& json, const std::string& msg, const std::string& what) {
  simdjson::dom::parser p;
  jt::JsonValue v = p.parse(json).value();
  try {
    (void)jt::classify(v);
    check(false, what + " (no throw)");
  } catch (const E& e) {
    check(msg == e.what(), what + " -> " + e.what());
  }
}

static jt::Shape shape_of(const std::string& json) {
  simdjson::dom::parser p;
  return jt::classify(p.parse(json).value());
}

int main() {
  expect_throw<jt::EmptyDataError>("null", "No JSON data to process", "null is empty");
  expect_throw<jt::EmptyDataError>("{}", "No JSON data to process", "{} is empty");
  expect_throw<jt::EmptyDataError>("[]", "No JSON data to process", "[] is empty");
  expect_throw<jt::InvalidShapeError>("\"just a string\"",
                                      "JSON data must be an array or object", "string top level");
  expect_throw<jt::InvalidShapeError>("42", "JSON data must be an array or object", "number top level");
  expect_throw<jt::InvalidShapeError>("true", "JSON data must be an array or object", "bool top level");
  expect_throw<jt::InvalidShapeError>("[null, 1]",
                                      "Invalid array data: null first element", "null first element");

  // both error kinds share the library base
  try {
    simdjson::dom::parser p;
    const std::string empty = "[]";
    (void)jt::classify(p.parse(empty).value());
  } catch (const jt::JsonTableError&) {
    check(true, "EmptyDataError is a JsonTableError");
  }

  auto s = shape_of(R"({"x":"y"})");
  check(s.mode == jt::ArrayMode::ObjectRows && s.single_object && s.estimated_size == 1,
        "mapping -> single ObjectRows record");

  s = shape_of(R"([{"a":1},{"b":2},{"c":3}])");
  check(s.mode == jt::ArrayMode::ObjectRows && !s.single_object && s.estimated_size == 3,
        "array of objects -> ObjectRows, size 3");

  s = shape_of(R"([[1,2],[3,4]])");
  check(s.mode == jt::ArrayMode::RawRows && s.estimated_size == 2, "array of arrays -> RawRows");

  s = shape_of(R"(["p","q","r"])");
  check(s.mode == jt::ArrayMode::ScalarRows && s.estimated_size == 3, "array of strings -> ScalarRows");

  // mode is fixed by the first element only
  s = shape_of(R"([{"a":1}, "bare", [1]])");
  check(s.mode == jt::ArrayMode::ObjectRows && s.estimated_size == 3, "mixed array keeps first-element mode");

  s = shape_of(R"([1, null, 3])");
  check(s.mode == jt::ArrayMode::ScalarRows, "null after first element is tolerated");

  check(jt::to_string(jt::ArrayMode::RawRows) == "raw_rows", "to_string(RawRows)");

  if (failures) { std::cerr << "[FAIL] " << failures << " check(s)\n"; return 1; }
  std::cout << "[PASS] shape classifier\n";
  return 0;
}

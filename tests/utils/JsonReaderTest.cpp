/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace PhantomMaze;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(trueVal.getType(), JsonType::Boolean);

  JsonValue numberVal(42.0);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_EQUAL(numberVal.asInt(), 42);

  JsonValue stringVal(std::string("hello"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue numberVal(2.5);
  BOOST_CHECK(numberVal.tryAsNumber().has_value());
  BOOST_CHECK_CLOSE(*numberVal.tryAsNumber(), 2.5, 0.001);
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(!numberVal.tryAsBool().has_value());

  JsonValue nullVal;
  BOOST_CHECK(!nullVal.tryAsInt().has_value());
}

BOOST_AUTO_TEST_CASE(TestMissingKeysYieldNull) {
  JsonObject obj;
  obj["speed"] = JsonValue(75.0);
  JsonValue objectVal(obj);

  BOOST_CHECK(objectVal.hasKey("speed"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK(objectVal["missing"].isNull());
  BOOST_CHECK(objectVal["speed"]["nested"].isNull());

  JsonArray arr;
  arr.push_back(JsonValue(1.0));
  JsonValue arrayVal(arr);
  BOOST_CHECK_EQUAL(arrayVal.size(), 1u);
  BOOST_CHECK(arrayVal[size_t{5}].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestParseLevelEntry) {
  JsonReader reader;
  const std::string json = R"({
    "levels": [
      { "ghostSpeedPc": 75, "frightTimeSeconds": 6, "name": "first" },
      { "ghostSpeedPc": 85.5, "flags": [true, false, null] }
    ]
  })";

  BOOST_REQUIRE(reader.parse(json));
  const JsonValue& levels = reader.getRoot()["levels"];
  BOOST_REQUIRE(levels.isArray());
  BOOST_CHECK_EQUAL(levels.size(), 2u);

  const JsonValue& first = levels[size_t{0}];
  BOOST_CHECK_EQUAL(first["ghostSpeedPc"].asInt(), 75);
  BOOST_CHECK_EQUAL(first["name"].asString(), "first");

  const JsonValue& second = levels[size_t{1}];
  BOOST_CHECK_CLOSE(second["ghostSpeedPc"].asNumber(), 85.5, 0.001);
  BOOST_CHECK_EQUAL(second["flags"].size(), 3u);
  BOOST_CHECK(second["flags"][size_t{2}].isNull());
}

BOOST_AUTO_TEST_CASE(TestNumbersAndEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"([-1.5, 2e2, 0, "a\"b\\c\nd"])"));

  const JsonValue& root = reader.getRoot();
  BOOST_CHECK_CLOSE(root[size_t{0}].asNumber(), -1.5, 0.001);
  BOOST_CHECK_CLOSE(root[size_t{1}].asNumber(), 200.0, 0.001);
  BOOST_CHECK_EQUAL(root[size_t{2}].asInt(), 0);
  BOOST_CHECK_EQUAL(root[size_t{3}].asString(), "a\"b\\c\nd");
}

BOOST_AUTO_TEST_CASE(TestErrorsReportPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"a\": }"));
  BOOST_CHECK(reader.getLastError().find("line 2") != std::string::npos);
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{} extra"));
  BOOST_CHECK(reader.getLastError().find("trailing") != std::string::npos);

  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse(""));
}

BOOST_AUTO_TEST_CASE(TestParseResetsPreviousError) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("nope"));
  BOOST_CHECK(reader.parse("{\"ok\": true}"));
  BOOST_CHECK(reader.getLastError().empty());
  BOOST_CHECK(reader.getRoot()["ok"].asBool());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const std::filesystem::path path =
      std::filesystem::temp_directory_path() / "phantom_json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"debug": {"show_ghost_targets": true}})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path.string()));
  BOOST_CHECK(reader.getRoot()["debug"]["show_ghost_targets"].asBool());
  std::filesystem::remove(path);

  BOOST_CHECK(!reader.loadFromFile(path.string()));
  BOOST_CHECK(reader.getLastError().find("Could not open") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

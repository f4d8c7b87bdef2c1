/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

using namespace HexCrawl;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue number(42.0);
  BOOST_CHECK(number.isNumber());
  BOOST_CHECK_EQUAL(number.asInt(), 42);

  JsonValue text("hello");
  BOOST_CHECK(text.isString());
  BOOST_CHECK_EQUAL(text.getType(), JsonType::String);
  BOOST_CHECK_EQUAL(text.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue text("goblin");
  BOOST_CHECK(!text.tryAsNumber().has_value());
  BOOST_CHECK(!text.tryAsBool().has_value());
  BOOST_REQUIRE(text.tryAsString().has_value());
  BOOST_CHECK_EQUAL(*text.tryAsString(), "goblin");

  JsonValue number(7.0);
  BOOST_REQUIRE(number.tryAsInt().has_value());
  BOOST_CHECK_EQUAL(*number.tryAsInt(), 7);
  BOOST_REQUIRE(number.tryAsNumber().has_value());
}

BOOST_AUTO_TEST_CASE(TestTryAsIntRejectsNonIntegers) {
  BOOST_CHECK(!JsonValue(7.9).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(-0.5).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(1e12).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(-1e12).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(std::numeric_limits<double>::infinity()).tryAsInt().has_value());
  BOOST_CHECK(!JsonValue(std::numeric_limits<double>::quiet_NaN()).tryAsInt().has_value());

  BOOST_CHECK_EQUAL(*JsonValue(-12.0).tryAsInt(), -12);
  BOOST_CHECK_EQUAL(*JsonValue(static_cast<double>(std::numeric_limits<int>::max())).tryAsInt(),
                    std::numeric_limits<int>::max());
  BOOST_CHECK_EQUAL(*JsonValue(static_cast<double>(std::numeric_limits<int>::min())).tryAsInt(),
                    std::numeric_limits<int>::min());

  // The float accessor still sees fractional values
  BOOST_CHECK_CLOSE(*JsonValue(7.9).tryAsNumber(), 7.9, 0.001);
}

BOOST_AUTO_TEST_CASE(TestMissingMembersReadAsNull) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({"stats": {"maxHp": 45}})"));
  const JsonValue &root = reader.getRoot();

  BOOST_CHECK(root.hasKey("stats"));
  BOOST_CHECK(!root.hasKey("abilities"));
  BOOST_CHECK(root["abilities"].isNull());
  BOOST_CHECK(root["abilities"]["deeper"].isNull());
  BOOST_CHECK_EQUAL(root["stats"]["maxHp"].asInt(), 45);
  BOOST_CHECK(root["stats"][0].isNull());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParseTests)

BOOST_AUTO_TEST_CASE(TestParseDocument) {
  JsonReader reader;
  const std::string json = R"({
    "monsters": [
      {"id": "goblin_warrior", "spawnWeight": 10, "tags": ["goblin", "melee"]},
      {"id": "cave_spider", "spawnWeight": 4.5, "boss": false, "loot": null}
    ]
  })";
  BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());

  const JsonValue &monsters = reader.getRoot()["monsters"];
  BOOST_REQUIRE(monsters.isArray());
  BOOST_REQUIRE_EQUAL(monsters.size(), 2u);
  BOOST_CHECK_EQUAL(monsters[0]["id"].asString(), "goblin_warrior");
  BOOST_CHECK_EQUAL(monsters[0]["tags"].size(), 2u);
  BOOST_CHECK_EQUAL(monsters[0]["tags"][1].asString(), "melee");
  BOOST_CHECK_CLOSE(monsters[1]["spawnWeight"].asNumber(), 4.5, 0.001);
  BOOST_CHECK_EQUAL(monsters[1]["boss"].asBool(), false);
  BOOST_CHECK(monsters[1]["loot"].isNull());
  BOOST_CHECK(monsters[2].isNull());
}

BOOST_AUTO_TEST_CASE(TestNumbersAndEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"([-12, 0.25, 1e3, "tab\tquote\" é"])"));
  const JsonValue &root = reader.getRoot();

  BOOST_CHECK_EQUAL(root[0].asInt(), -12);
  BOOST_CHECK_CLOSE(root[1].asNumber(), 0.25, 0.001);
  BOOST_CHECK_CLOSE(root[2].asNumber(), 1000.0, 0.001);
  BOOST_CHECK_EQUAL(root[3].asString(), "tab\tquote\" \xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestMalformedInputReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\"a\": 1,\n  \"b\" 2}"));
  BOOST_CHECK(reader.getLastError().find("line 2") != std::string::npos);

  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\": 1} trailing"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("01"));
  BOOST_CHECK(!reader.parse(""));
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  std::string deep(200, '[');
  deep += std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("Nesting too deep") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const std::string path = "json_reader_test_tmp.json";
  {
    std::ofstream out(path);
    out << R"({"game": {"maxRounds": 20}})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["game"]["maxRounds"].asInt(), 20);
  std::remove(path.c_str());

  BOOST_CHECK(!reader.loadFromFile("does/not/exist.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()

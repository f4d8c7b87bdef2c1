/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>
#include <vector>

using namespace HexCrawl;

// Test fixture for setup/cleanup
struct SettingsTestFixture {
    const std::string testFile = "test_data/test_settings.json";
    SettingsManager settings;

    SettingsTestFixture() {
        HEXCRAWL_ENABLE_BENCHMARK_MODE();
        std::filesystem::create_directories("test_data");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        HEXCRAWL_DISABLE_BENCHMARK_MODE();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetInt) {
    BOOST_CHECK(settings.set("game", "maxRounds", 30));
    BOOST_CHECK_EQUAL(settings.get<int>("game", "maxRounds", 0), 30);

    // Default when key doesn't exist
    BOOST_CHECK_EQUAL(settings.get<int>("game", "nonexistent", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestGetSetFloat) {
    BOOST_CHECK(settings.set("threat", "decayRate", 0.25f));
    BOOST_CHECK_CLOSE(settings.get<float>("threat", "decayRate", 0.0f), 0.25f, 0.001f);

    // Whole-number settings satisfy float reads
    settings.set("threat", "avoidRepeatTargetRounds", 2);
    BOOST_CHECK_CLOSE(settings.get<float>("threat", "avoidRepeatTargetRounds", 0.0f), 2.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestGetSetBoolAndString) {
    BOOST_CHECK(settings.set("threat", "enabled", false));
    BOOST_CHECK_EQUAL(settings.get<bool>("threat", "enabled", true), false);

    BOOST_CHECK(settings.set("game", "difficulty", std::string("hard")));
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "difficulty", "normal"), "hard");

    BOOST_CHECK(settings.set("game", "mode", "skirmish"));
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "mode"), "skirmish");
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    settings.set("game", "maxRounds", 20);
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "maxRounds", "none"), "none");
    BOOST_CHECK_EQUAL(settings.get<bool>("game", "maxRounds", true), true);

    settings.set("threat", "decayRate", 0.5f);
    BOOST_CHECK_EQUAL(settings.get<int>("threat", "decayRate", -1), -1);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveClear) {
    settings.set("combat", "rngSeed", 99);
    BOOST_CHECK(settings.has("combat", "rngSeed"));
    BOOST_CHECK(!settings.has("combat", "missing"));
    BOOST_CHECK(!settings.has("nowhere", "rngSeed"));

    BOOST_CHECK(settings.remove("combat", "rngSeed"));
    BOOST_CHECK(!settings.remove("combat", "rngSeed"));
    BOOST_CHECK(!settings.has("combat", "rngSeed"));

    settings.set("a", "x", 1);
    settings.set("b", "y", 2);
    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeys) {
    settings.set("game", "maxRounds", 20);
    settings.set("game", "turnTimeoutMs", 30000);
    settings.set("pathfinding", "maxIterations", 1000);

    auto categories = settings.getCategories();
    std::sort(categories.begin(), categories.end());
    BOOST_REQUIRE_EQUAL(categories.size(), 2u);
    BOOST_CHECK_EQUAL(categories[0], "game");
    BOOST_CHECK_EQUAL(categories[1], "pathfinding");

    BOOST_CHECK_EQUAL(settings.getKeys("game").size(), 2u);
    BOOST_CHECK(settings.getKeys("missing").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "game": {"maxRounds": 25, "difficulty": "hard"},
        "threat": {"enabled": true, "decayRate": 0.15},
        "ignored": 5
    })");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("game", "maxRounds", 0), 25);
    BOOST_CHECK_EQUAL(settings.get<std::string>("game", "difficulty"), "hard");
    BOOST_CHECK_EQUAL(settings.get<bool>("threat", "enabled", false), true);
    BOOST_CHECK_CLOSE(settings.get<float>("threat", "decayRate", 0.0f), 0.15f, 0.001f);
    BOOST_CHECK(!settings.has("ignored", "ignored"));
}

BOOST_AUTO_TEST_CASE(TestLoadKeepsUnrelatedValues) {
    settings.set("combat", "rngSeed", 7);
    BOOST_REQUIRE(settings.loadFromString(R"({"game": {"maxRounds": 10}})"));
    BOOST_CHECK_EQUAL(settings.get<int>("combat", "rngSeed", 0), 7);
    BOOST_CHECK_EQUAL(settings.get<int>("game", "maxRounds", 0), 10);
}

BOOST_AUTO_TEST_CASE(TestLoadFailures) {
    BOOST_CHECK(!settings.loadFromFile("test_data/does_not_exist.json"));
    BOOST_CHECK(!settings.loadFromString("{ not json"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestConcurrentReads) {
    settings.set("game", "maxRounds", 20);

    std::vector<std::thread> readers;
    std::vector<int> results(8, 0);
    for (size_t i = 0; i < results.size(); ++i) {
        readers.emplace_back([this, &results, i]() {
            for (int j = 0; j < 100; ++j) {
                results[i] = settings.get<int>("game", "maxRounds", 0);
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    for (int value : results) {
        BOOST_CHECK_EQUAL(value, 20);
    }
}

BOOST_AUTO_TEST_SUITE_END()

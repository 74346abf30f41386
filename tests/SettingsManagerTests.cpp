/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace Lattice;

struct SettingsTestFixture {
    SettingsManager settings;
    const std::string testFile = "test_data/test_cache_settings.json";

    SettingsTestFixture() {
        std::filesystem::create_directories("test_data");
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypes) {
    BOOST_CHECK(settings.set("block_properties", "capacity", 65536));
    BOOST_CHECK(settings.set("paths", "weight", 0.75f));
    BOOST_CHECK(settings.set("light", "enabled", true));
    BOOST_CHECK(settings.set("light", "eviction", "lru"));

    BOOST_CHECK_EQUAL(settings.get<int>("block_properties", "capacity", 0), 65536);
    BOOST_CHECK_CLOSE(settings.get<float>("paths", "weight", 0.0f), 0.75f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("light", "enabled", false), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("light", "eviction", ""), "lru");

    // Missing keys return the default
    BOOST_CHECK_EQUAL(settings.get<int>("block_properties", "missing", 42), 42);
    BOOST_CHECK_EQUAL(settings.get<int>("missing", "capacity", 7), 7);
}

BOOST_AUTO_TEST_CASE(TestTypeMismatch) {
    settings.set("light", "eviction", std::string("lru"));
    BOOST_CHECK_EQUAL(settings.get<int>("light", "eviction", 99), 99);

    // An integer setting is readable as a float
    settings.set("spatial_index", "cell_size", 16);
    BOOST_CHECK_CLOSE(settings.get<float>("spatial_index", "cell_size", 0.0f), 16.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestHasRemoveAndClear) {
    settings.set("a", "x", 1);
    settings.set("a", "y", 2);
    settings.set("b", "z", 3);

    BOOST_CHECK(settings.has("a", "x"));
    BOOST_CHECK(settings.remove("a", "x"));
    BOOST_CHECK(!settings.remove("a", "x"));
    BOOST_CHECK(!settings.has("a", "x"));

    BOOST_CHECK(settings.clearCategory("a"));
    BOOST_CHECK(!settings.clearCategory("a"));
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 1u);

    settings.clearAll();
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestRemovingLastKeyDropsCategory) {
    settings.set("a", "x", 1);
    BOOST_CHECK(settings.remove("a", "x"));
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestGetKeys) {
    settings.set("biomes", "capacity", 1024);
    settings.set("biomes", "eviction", "clear_all");
    auto keys = settings.getKeys("biomes");
    std::sort(keys.begin(), keys.end());
    BOOST_REQUIRE_EQUAL(keys.size(), 2u);
    BOOST_CHECK_EQUAL(keys[0], "capacity");
    BOOST_CHECK_EQUAL(keys[1], "eviction");
    BOOST_CHECK(settings.getKeys("missing").empty());
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "block_properties": { "capacity": 4096, "eviction": "clear_all", "staleness": "version" },
        "paths": { "ttl_ticks": 40, "weight": 1.5, "enabled": false },
        "ignored": 5
    })");

    BOOST_REQUIRE(settings.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(settings.get<int>("block_properties", "capacity", 0), 4096);
    BOOST_CHECK_EQUAL(settings.get<std::string>("block_properties", "staleness", ""), "version");
    BOOST_CHECK_EQUAL(settings.get<int>("paths", "ttl_ticks", 0), 40);
    BOOST_CHECK_CLOSE(settings.get<float>("paths", "weight", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK_EQUAL(settings.get<bool>("paths", "enabled", true), false);
    BOOST_CHECK(!settings.has("ignored", "ignored"));
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    settings.set("light", "capacity", 2048);
    settings.set("light", "scale", 2.0f);
    settings.set("light", "name", std::string("sky \"light\""));
    settings.set("light", "enabled", true);
    BOOST_REQUIRE(settings.saveToFile(testFile));

    SettingsManager reloaded;
    BOOST_REQUIRE(reloaded.loadFromFile(testFile));
    BOOST_CHECK_EQUAL(reloaded.get<int>("light", "capacity", 0), 2048);
    BOOST_CHECK_CLOSE(reloaded.get<float>("light", "scale", 0.0f), 2.0f, 0.001f);
    BOOST_CHECK_EQUAL(reloaded.get<std::string>("light", "name", ""), "sky \"light\"");
    BOOST_CHECK_EQUAL(reloaded.get<bool>("light", "enabled", false), true);
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    createTestFile("{ invalid json }");
    BOOST_CHECK(!settings.loadFromFile(testFile));
    BOOST_CHECK(!settings.loadFromFile("test_data/does_not_exist.json"));
    BOOST_CHECK(!settings.loadFromString("[1, 2, 3]"));
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    int calls = 0;
    std::string lastKey;
    const size_t id = settings.registerChangeListener("paths",
        [&](const std::string&, const std::string& key, const SettingsManager::SettingValue& value) {
            ++calls;
            lastKey = key;
            BOOST_CHECK(std::holds_alternative<int>(value));
        });

    settings.set("paths", "ttl_ticks", 10);
    settings.set("light", "ttl_ticks", 10);
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(lastKey, "ttl_ticks");

    settings.unregisterChangeListener(id);
    settings.set("paths", "ttl_ticks", 11);
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_CASE(TestGlobalListenerMayReadSettings) {
    int seen = 0;
    settings.registerChangeListener("",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue&) {
            // Runs outside the settings lock
            seen = settings.get<int>(category, key, -1);
        });
    settings.set("biomes", "capacity", 77);
    BOOST_CHECK_EQUAL(seen, 77);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    LATTICE_ENABLE_BENCHMARK_MODE();
    std::atomic<int> badReads{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 500; ++i) {
                settings.set("cache" + std::to_string(t), "capacity", i);
                const int value = settings.get<int>("cache" + std::to_string(t), "capacity", -1);
                if (value < 0 || value > i) {
                    badReads.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    LATTICE_DISABLE_BENCHMARK_MODE();

    BOOST_CHECK_EQUAL(badReads.load(), 0);
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 4u);
}

BOOST_AUTO_TEST_SUITE_END()

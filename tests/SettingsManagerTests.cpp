/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SettingsManagerTests
#include <boost/test/unit_test.hpp>
#include "managers/SettingsManager.hpp"
#include "utils/JsonReader.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

using namespace Vantage;

struct SettingsTestFixture {
    const std::string testFile = "test_data/test_settings.json";

    SettingsTestFixture() {
        std::filesystem::create_directories("test_data");
        SettingsManager::Instance().clearAll();
    }

    ~SettingsTestFixture() {
        std::error_code ec;
        std::filesystem::remove(testFile, ec);
        SettingsManager::Instance().clearAll();
    }

    void createTestFile(const std::string& content) {
        std::ofstream file(testFile);
        file << content;
    }
};

BOOST_FIXTURE_TEST_SUITE(SettingsManagerTestSuite, SettingsTestFixture)

BOOST_AUTO_TEST_CASE(TestGetSetTypes) {
    auto& settings = SettingsManager::Instance();

    BOOST_CHECK(settings.set("postquery", "max_worker_count", 8));
    BOOST_CHECK(settings.set("postquery", "spread", 1.5f));
    BOOST_CHECK(settings.set("postquery", "enabled", true));
    BOOST_CHECK(settings.set("demo", "scenario", std::string("courtyard")));
    BOOST_CHECK(settings.set("demo", "label", "literal"));

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "max_worker_count", 0), 8);
    BOOST_CHECK_CLOSE(settings.get<float>("postquery", "spread", 0.0f), 1.5f, 0.001f);
    BOOST_CHECK(settings.get<bool>("postquery", "enabled", false));
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "scenario"), "courtyard");
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "label"), "literal");

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "missing", 42), 42);
}

BOOST_AUTO_TEST_CASE(TestNumericConversion) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "frames_per_tick", 25.0f);
    settings.set("postquery", "ratio", 3);

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "frames_per_tick", 0), 25);
    BOOST_CHECK_CLOSE(settings.get<float>("postquery", "ratio", 0.0f), 3.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestIntReadOfNonWholeFloat) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "fractional", 4.5f);
    settings.set("postquery", "huge", 5e9f);
    settings.set("postquery", "negative", -7.0f);

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "fractional", 11), 11);
    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "huge", 11), 11);
    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "negative", 11), -7);

    BOOST_CHECK(!SettingsManager::toWholeInt(SettingsManager::SettingValue(4.5f)).has_value());
    BOOST_CHECK(!SettingsManager::toWholeInt(SettingsManager::SettingValue(std::string("4"))).has_value());
    auto stored = settings.getValue("postquery", "huge");
    BOOST_REQUIRE(stored.has_value());
    BOOST_CHECK(std::holds_alternative<float>(*stored));
    BOOST_CHECK(!settings.getValue("postquery", "missing").has_value());
}

BOOST_AUTO_TEST_CASE(TestTypeMismatchReturnsDefault) {
    auto& settings = SettingsManager::Instance();
    settings.set("demo", "name", std::string("guard"));
    settings.set("demo", "count", 4);

    BOOST_CHECK_EQUAL(settings.get<int>("demo", "name", -1), -1);
    BOOST_CHECK_EQUAL(settings.get<bool>("demo", "count", true), true);
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "count", "none"), "none");
}

BOOST_AUTO_TEST_CASE(TestHasAndRemove) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "max_worker_count", 5);

    BOOST_CHECK(settings.has("postquery", "max_worker_count"));
    BOOST_CHECK(settings.remove("postquery", "max_worker_count"));
    BOOST_CHECK(!settings.has("postquery", "max_worker_count"));
    BOOST_CHECK(!settings.remove("postquery", "max_worker_count"));

    // Removing the last key drops the category
    BOOST_CHECK(settings.getCategories().empty());
}

BOOST_AUTO_TEST_CASE(TestCategoriesAndKeys) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "frames_per_tick", 25);
    settings.set("postquery", "max_worker_count", 5);
    settings.set("demo", "frames", 60);

    std::vector<std::string> categories = settings.getCategories();
    BOOST_REQUIRE_EQUAL(categories.size(), 2u);
    BOOST_CHECK_EQUAL(categories[0], "demo");
    BOOST_CHECK_EQUAL(categories[1], "postquery");

    std::vector<std::string> keys = settings.getKeys("postquery");
    BOOST_REQUIRE_EQUAL(keys.size(), 2u);
    BOOST_CHECK_EQUAL(keys[0], "frames_per_tick");
    BOOST_CHECK_EQUAL(keys[1], "max_worker_count");
    BOOST_CHECK(settings.getKeys("missing").empty());

    BOOST_CHECK(settings.clearCategory("demo"));
    BOOST_CHECK(!settings.clearCategory("demo"));
    BOOST_CHECK_EQUAL(settings.getCategories().size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
    createTestFile(R"({
        "postquery": { "max_worker_count": 3, "frames_per_tick": 12 },
        "demo": { "scale": 0.5, "verbose": true, "name": "courtyard", "ignored": [1, 2] },
        "not_a_category": 7
    })");

    auto& settings = SettingsManager::Instance();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "max_worker_count", 0), 3);
    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "frames_per_tick", 0), 12);
    BOOST_CHECK_CLOSE(settings.get<float>("demo", "scale", 0.0f), 0.5f, 0.001f);
    BOOST_CHECK(settings.get<bool>("demo", "verbose", false));
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "name"), "courtyard");
    BOOST_CHECK(!settings.has("demo", "ignored"));
    BOOST_CHECK(!settings.has("not_a_category", ""));
}

BOOST_AUTO_TEST_CASE(TestInvalidFile) {
    auto& settings = SettingsManager::Instance();
    BOOST_CHECK(!settings.loadFromFile("test_data/does_not_exist.json"));

    createTestFile("{ \"postquery\": ");
    BOOST_CHECK(!settings.loadFromFile(testFile));

    createTestFile("[1, 2, 3]");
    BOOST_CHECK(!settings.loadFromFile(testFile));
}

BOOST_AUTO_TEST_CASE(TestSaveAndReload) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "max_worker_count", 7);
    settings.set("postquery", "enabled", false);
    settings.set("demo", "title", std::string("say \"hi\""));

    BOOST_REQUIRE(settings.saveToFile(testFile));
    settings.clearAll();
    BOOST_REQUIRE(settings.loadFromFile(testFile));

    BOOST_CHECK_EQUAL(settings.get<int>("postquery", "max_worker_count", 0), 7);
    BOOST_CHECK_EQUAL(settings.get<bool>("postquery", "enabled", true), false);
    BOOST_CHECK_EQUAL(settings.get<std::string>("demo", "title"), "say \"hi\"");
}

BOOST_AUTO_TEST_CASE(TestLoadFromJsonNotifiesListeners) {
    auto& settings = SettingsManager::Instance();
    std::vector<std::string> changed;
    size_t id = settings.registerChangeListener(
        "postquery",
        [&changed](const std::string&, const std::string& key, const SettingsManager::SettingValue&) {
            changed.push_back(key);
        });

    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"postquery": {"frames_per_tick": 30}, "demo": {"frames": 10}})"));
    BOOST_REQUIRE(settings.loadFromJson(reader.getRoot(), "inline"));

    BOOST_REQUIRE_EQUAL(changed.size(), 1u);
    BOOST_CHECK_EQUAL(changed[0], "frames_per_tick");
    settings.unregisterChangeListener(id);
}

BOOST_AUTO_TEST_CASE(TestChangeListener) {
    auto& settings = SettingsManager::Instance();
    int calls = 0;
    int lastValue = 0;

    size_t id = settings.registerChangeListener(
        "postquery",
        [&](const std::string& category, const std::string& key, const SettingsManager::SettingValue& value) {
            BOOST_CHECK_EQUAL(category, "postquery");
            BOOST_CHECK_EQUAL(key, "frames_per_tick");
            lastValue = std::get<int>(value);
            ++calls;
        });
    BOOST_CHECK_EQUAL(settings.getListenerCount(), 1u);

    settings.set("postquery", "frames_per_tick", 40);
    settings.set("demo", "frames_per_tick", 1);
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(lastValue, 40);

    settings.unregisterChangeListener(id);
    settings.set("postquery", "frames_per_tick", 50);
    BOOST_CHECK_EQUAL(calls, 1);
    BOOST_CHECK_EQUAL(settings.getListenerCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestGlobalChangeListener) {
    auto& settings = SettingsManager::Instance();
    int calls = 0;
    size_t id = settings.registerChangeListener(
        "", [&calls](const std::string&, const std::string&, const SettingsManager::SettingValue&) { ++calls; });

    settings.set("postquery", "a", 1);
    settings.set("demo", "b", true);
    BOOST_CHECK_EQUAL(calls, 2);
    settings.unregisterChangeListener(id);
}

BOOST_AUTO_TEST_CASE(TestListenerMayUnregisterItself) {
    auto& settings = SettingsManager::Instance();
    int calls = 0;
    size_t id = 0;
    id = settings.registerChangeListener(
        "postquery",
        [&](const std::string&, const std::string&, const SettingsManager::SettingValue&) {
            ++calls;
            settings.unregisterChangeListener(id);
        });

    settings.set("postquery", "a", 1);
    settings.set("postquery", "a", 2);
    BOOST_CHECK_EQUAL(calls, 1);
}

BOOST_AUTO_TEST_CASE(TestThreadSafety) {
    auto& settings = SettingsManager::Instance();
    settings.set("postquery", "counter", 0);

    std::atomic<int> reads{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&settings, &reads, t]() {
            for (int i = 0; i < 250; ++i) {
                if (t % 2 == 0) {
                    settings.set("postquery", "counter", i);
                } else {
                    settings.get<int>("postquery", "counter", 0);
                    reads.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(reads.load(), 500);
    BOOST_CHECK(settings.has("postquery", "counter"));
}

BOOST_AUTO_TEST_SUITE_END()

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FrameScheduler.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/ActorDataManager.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/PostQueryManager.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/ScenarioLoader.hpp"
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>

using namespace Vantage;

namespace {

const char* DEFAULT_SCENARIO = "res/scenarios/courtyard.json";
const char* SETTINGS_FILE = "res/settings.json";
constexpr uint64_t DEFAULT_FRAMES = 60;

void shutdownSystems() {
    PostQueryManager::Instance().clean();
    ActorDataManager::Instance().clean();
    CollisionManager::Instance().clean();
    FrameScheduler::Instance().clean();
    ThreadSystem::Instance().clean();
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string scenarioPath = argc > 1 ? argv[1] : DEFAULT_SCENARIO;
    uint64_t frames = DEFAULT_FRAMES;
    if (argc > 2) {
        const char* arg = argv[2];
        auto [ptr, ec] = std::from_chars(arg, arg + std::strlen(arg), frames);
        if (ec != std::errc() || *ptr != '\0' || frames == 0) {
            std::cerr << "Usage: vantage_postquery_demo [scenario.json] [frames]" << std::endl;
            return 1;
        }
    }

    if (!ThreadSystem::Instance().init()) {
        VANTAGE_CRITICAL("Main", "Failed to initialize ThreadSystem");
        return 1;
    }
    if (!CollisionManager::Instance().init() || !ActorDataManager::Instance().init()) {
        VANTAGE_CRITICAL("Main", "Failed to initialize world managers");
        shutdownSystems();
        return 1;
    }

    // Base settings first; the scenario's own settings block overrides them
    if (std::filesystem::exists(SETTINGS_FILE) &&
        !SettingsManager::Instance().loadFromFile(SETTINGS_FILE)) {
        VANTAGE_WARN("Main", std::format("Ignoring unreadable {}", SETTINGS_FILE));
    }

    // Scenario settings must be in place before PostQueryManager reads them
    ScenarioLoader loader;
    Scenario scenario;
    if (!loader.loadFromFile(scenarioPath, scenario)) {
        std::cerr << loader.getLastError() << std::endl;
        shutdownSystems();
        return 1;
    }

    auto& postQueries = PostQueryManager::Instance();
    if (!postQueries.init()) {
        std::cerr << "PostQueryManager rejected its configuration" << std::endl;
        shutdownSystems();
        return 1;
    }

    for (const auto& command : scenario.queries) {
        postQueries.enqueueCommand(command);
    }

    auto& scheduler = FrameScheduler::Instance();
    for (uint64_t frame = 0; frame < frames; ++frame) {
        scheduler.update();
    }

    std::cout << std::format("Ran {} frames of {}\n", frames, scenarioPath);
    for (const auto& name : scenario.actorNames) {
        const ActorHandle handle = scenario.actors.at(name);
        const auto& posts = postQueries.getPosts(handle);
        std::cout << std::format("{} ({}): {} posts{}\n", name, handle.toString(), posts.size(),
                                 postQueries.isFree(handle) ? "" : " [query pending]");
        for (const auto& post : posts) {
            std::cout << "  " << post << '\n';
        }
    }

    const PostQueryStats stats = postQueries.getStats();
    std::cout << std::format("enqueued {}, dispatched {}, completed {}, busy drops {}, invalid drops {}\n",
                             stats.totalEnqueued, stats.totalDispatched, stats.totalCompleted,
                             stats.busyDrops, stats.invalidDrops);

    shutdownSystems();
    return 0;
}

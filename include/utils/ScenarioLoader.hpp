/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCENARIO_LOADER_HPP
#define SCENARIO_LOADER_HPP

/**
 * @file ScenarioLoader.hpp
 * @brief Populates the world from a JSON scenario description
 *
 * Format:
 * {
 *   "settings":  { "postquery": { "frames_per_tick": 25 } },
 *   "obstacles": [ { "center": [x,y,z], "half_size": [x,y,z], "layer": 4 } ],
 *   "actors":    [ { "name": "guard", "position": [x,y,z] } ],
 *   "queries":   [ { "self": "guard", "target": "player", "offset": [x,y,z],
 *                    "layer_mask": 4, "angle": 90, "distance": 10,
 *                    "step": 8, "depth": 1 } ]
 * }
 *
 * Every section is optional. The whole document is validated before anything
 * is applied, so a rejected scenario leaves the managers untouched.
 */

#include "ai/PostQueryCommand.hpp"
#include "collisions/CollisionBody.hpp"
#include "entities/ActorHandle.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace Vantage {

class JsonValue;

struct Scenario {
    std::vector<std::string> actorNames;                  // Declaration order
    std::unordered_map<std::string, ActorHandle> actors;
    std::vector<BodyID> obstacles;
    std::vector<PostQueryCommand> queries;
};

class ScenarioLoader {
public:
    bool loadFromFile(const std::string& path, Scenario& out);
    bool loadFromString(const std::string& json, Scenario& out, const std::string& source = "<string>");

    const std::string& getLastError() const { return m_lastError; }

private:
    bool load(const JsonValue& root, Scenario& out, const std::string& source);
    bool fail(const std::string& message);

    std::string m_lastError;
};

} // namespace Vantage

#endif // SCENARIO_LOADER_HPP

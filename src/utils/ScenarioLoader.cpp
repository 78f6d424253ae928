/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ScenarioLoader.hpp"
#include "collisions/AABB.hpp"
#include "core/Logger.hpp"
#include "managers/ActorDataManager.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <limits>
#include <optional>

namespace Vantage {

namespace {

std::optional<Vector3D> readVector(const JsonValue& value) {
    if (!value.isArray() || value.size() != 3) {
        return std::nullopt;
    }
    for (size_t i = 0; i < 3; ++i) {
        if (!value[i].isNumber()) {
            return std::nullopt;
        }
    }
    return Vector3D(static_cast<float>(value[0].asNumber()),
                    static_cast<float>(value[1].asNumber()),
                    static_cast<float>(value[2].asNumber()));
}

std::optional<uint32_t> readMask(const JsonValue& value) {
    auto number = value.tryAsNumber();
    if (!number || *number < 0.0 ||
        *number > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*number);
}

struct PendingObstacle {
    AABB box;
    uint32_t layer{Layer_Environment};
};

struct PendingActor {
    std::string name;
    Vector3D position;
};

struct PendingQuery {
    std::string self;
    std::string target;
    Vector3D offset;
    uint32_t layerMask{Layer_All};
    PostQueryParameters parameters;
};

} // namespace

bool ScenarioLoader::loadFromFile(const std::string& path, Scenario& out) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        return fail(std::format("Failed to read scenario {}: {}", path, reader.getLastError()));
    }
    return load(reader.getRoot(), out, path);
}

bool ScenarioLoader::loadFromString(const std::string& json, Scenario& out, const std::string& source) {
    JsonReader reader;
    if (!reader.parse(json)) {
        return fail(std::format("Failed to parse scenario {}: {}", source, reader.getLastError()));
    }
    return load(reader.getRoot(), out, source);
}

bool ScenarioLoader::load(const JsonValue& root, Scenario& out, const std::string& source) {
    if (!root.isObject()) {
        return fail(std::format("Scenario {} root is not an object", source));
    }

    const JsonValue& settings = root["settings"];
    if (!settings.isNull() && !settings.isObject()) {
        return fail("\"settings\" must be an object");
    }

    std::vector<PendingObstacle> obstacles;
    const JsonValue& obstacleList = root["obstacles"];
    if (!obstacleList.isNull() && !obstacleList.isArray()) {
        return fail("\"obstacles\" must be an array");
    }
    for (size_t i = 0; i < obstacleList.size(); ++i) {
        const JsonValue& entry = obstacleList[i];
        auto center = readVector(entry["center"]);
        auto halfSize = readVector(entry["half_size"]);
        if (!center || !halfSize) {
            return fail(std::format("obstacles[{}] needs \"center\" and \"half_size\" as [x,y,z]", i));
        }
        if (halfSize->getX() <= 0.0f || halfSize->getY() <= 0.0f || halfSize->getZ() <= 0.0f) {
            return fail(std::format("obstacles[{}] has a non-positive half_size", i));
        }
        PendingObstacle obstacle{AABB(*center, *halfSize), Layer_Environment};
        if (entry.hasKey("layer")) {
            auto layer = readMask(entry["layer"]);
            if (!layer || *layer == 0) {
                return fail(std::format("obstacles[{}] has an invalid layer", i));
            }
            obstacle.layer = *layer;
        }
        obstacles.push_back(obstacle);
    }

    std::vector<PendingActor> actors;
    std::unordered_map<std::string, size_t> actorIndex;
    const JsonValue& actorList = root["actors"];
    if (!actorList.isNull() && !actorList.isArray()) {
        return fail("\"actors\" must be an array");
    }
    for (size_t i = 0; i < actorList.size(); ++i) {
        const JsonValue& entry = actorList[i];
        auto name = entry["name"].tryAsString();
        auto position = readVector(entry["position"]);
        if (!name || name->empty() || !position) {
            return fail(std::format("actors[{}] needs a \"name\" and a \"position\" [x,y,z]", i));
        }
        if (!actorIndex.emplace(*name, actors.size()).second) {
            return fail(std::format("Duplicate actor name '{}'", *name));
        }
        actors.push_back({*name, *position});
    }

    std::vector<PendingQuery> queries;
    const JsonValue& queryList = root["queries"];
    if (!queryList.isNull() && !queryList.isArray()) {
        return fail("\"queries\" must be an array");
    }
    for (size_t i = 0; i < queryList.size(); ++i) {
        const JsonValue& entry = queryList[i];
        PendingQuery query;

        auto self = entry["self"].tryAsString();
        auto target = entry["target"].tryAsString();
        if (!self || !target) {
            return fail(std::format("queries[{}] needs \"self\" and \"target\" actor names", i));
        }
        if (!actorIndex.contains(*self) || !actorIndex.contains(*target)) {
            return fail(std::format("queries[{}] references an unknown actor", i));
        }
        query.self = *self;
        query.target = *target;

        if (entry.hasKey("offset")) {
            auto offset = readVector(entry["offset"]);
            if (!offset) {
                return fail(std::format("queries[{}] \"offset\" must be [x,y,z]", i));
            }
            query.offset = *offset;
        }
        if (entry.hasKey("layer_mask")) {
            auto mask = readMask(entry["layer_mask"]);
            if (!mask) {
                return fail(std::format("queries[{}] has an invalid layer_mask", i));
            }
            query.layerMask = *mask;
        }

        PostQueryParameters& params = query.parameters;
        params.angle = static_cast<float>(entry["angle"].tryAsNumber().value_or(params.angle));
        params.distance = static_cast<float>(entry["distance"].tryAsNumber().value_or(params.distance));
        params.step = entry["step"].tryAsInt().value_or(params.step);
        params.depth = entry["depth"].tryAsInt().value_or(params.depth);
        if (params.rayCount() == 0 || params.distance <= 0.0f) {
            return fail(std::format("queries[{}] needs positive step, depth and distance", i));
        }
        queries.push_back(query);
    }

    // Everything validated; apply
    if (settings.isObject() && !SettingsManager::Instance().loadFromJson(settings, source)) {
        return fail(std::format("Scenario {} settings were rejected", source));
    }

    out = Scenario{};

    auto& collisions = CollisionManager::Instance();
    for (const auto& obstacle : obstacles) {
        BodyID id = collisions.addStaticBody(obstacle.box, obstacle.layer);
        if (id != UniqueID::INVALID_ID) {
            out.obstacles.push_back(id);
        }
    }

    auto& actorManager = ActorDataManager::Instance();
    for (const auto& actor : actors) {
        ActorHandle handle = actorManager.createActor(actor.position);
        if (!handle.isValid()) {
            return fail(std::format("Failed to create actor '{}'", actor.name));
        }
        out.actors.emplace(actor.name, handle);
        out.actorNames.push_back(actor.name);
    }

    for (const auto& query : queries) {
        PostQueryCommand command;
        command.self = out.actors.at(query.self);
        command.target = out.actors.at(query.target);
        command.offset = query.offset;
        command.layerMask = query.layerMask;
        command.parameters = query.parameters;
        out.queries.push_back(command);
    }

    SCENARIO_INFO(std::format("Loaded scenario {}: {} obstacles, {} actors, {} queries",
                              source, out.obstacles.size(), out.actors.size(), out.queries.size()));
    m_lastError.clear();
    return true;
}

bool ScenarioLoader::fail(const std::string& message) {
    m_lastError = message;
    SCENARIO_ERROR(message);
    return false;
}

} // namespace Vantage

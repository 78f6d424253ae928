/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CollisionManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <mutex>

namespace Vantage {

bool CollisionManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    {
        std::unique_lock<std::shared_mutex> lock(m_bodiesMutex);
        m_bodies.clear();
        m_bodies.reserve(256);
    }
    m_totalRaycasts.store(0, std::memory_order_relaxed);
    m_initialized.store(true, std::memory_order_release);
    COLLISION_INFO("CollisionManager initialized");
    return true;
}

void CollisionManager::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(m_bodiesMutex);
    COLLISION_INFO(std::format("CollisionManager cleaned ({} bodies released)", m_bodies.size()));
    m_bodies.clear();
    m_initialized.store(false, std::memory_order_release);
}

BodyID CollisionManager::addStaticBody(const AABB& aabb, uint32_t layer) {
    if (aabb.halfSize.getX() <= 0.0f || aabb.halfSize.getY() <= 0.0f ||
        aabb.halfSize.getZ() <= 0.0f) {
        COLLISION_WARN("Rejected static body with non-positive half extents");
        return UniqueID::INVALID_ID;
    }

    CollisionBody body;
    body.id = UniqueID::generate();
    body.aabb = aabb;
    body.layer = layer;

    std::unique_lock<std::shared_mutex> lock(m_bodiesMutex);
    m_bodies.push_back(body);
    return body.id;
}

bool CollisionManager::removeBody(BodyID id) {
    std::unique_lock<std::shared_mutex> lock(m_bodiesMutex);
    auto it = std::find_if(m_bodies.begin(), m_bodies.end(),
                           [id](const CollisionBody& b) { return b.id == id; });
    if (it == m_bodies.end()) {
        return false;
    }
    m_bodies.erase(it);
    return true;
}

size_t CollisionManager::getBodyCount() const {
    std::shared_lock<std::shared_mutex> lock(m_bodiesMutex);
    return m_bodies.size();
}

RaycastHit CollisionManager::raycast(const RaycastCommand& command) const {
    std::shared_lock<std::shared_mutex> lock(m_bodiesMutex);
    m_totalRaycasts.fetch_add(1, std::memory_order_relaxed);
    return raycastLocked(command);
}

void CollisionManager::raycastBatch(std::span<const RaycastCommand> commands,
                                    std::span<RaycastHit> hits) const {
    const size_t count = std::min(commands.size(), hits.size());
    std::shared_lock<std::shared_mutex> lock(m_bodiesMutex);
    for (size_t i = 0; i < count; ++i) {
        hits[i] = raycastLocked(commands[i]);
    }
    m_totalRaycasts.fetch_add(count, std::memory_order_relaxed);
}

RaycastHit CollisionManager::raycastLocked(const RaycastCommand& command) const {
    RaycastHit best;
    if (command.distance <= 0.0f || command.direction.lengthSquared() <= 0.0f) {
        return best;
    }

    const Vector3D direction = command.direction.normalized();
    float bestDistance = command.distance;

    for (const auto& body : m_bodies) {
        if ((body.layer & command.layerMask) == 0) {
            continue;
        }
        float t = 0.0f;
        Vector3D normal;
        if (body.aabb.raycast(command.from, direction, bestDistance, t, normal) &&
            (!best.hasHit() || t < best.distance)) {
            best.point = command.from + direction * t;
            best.normal = normal;
            best.distance = t;
            best.bodyId = body.id;
            bestDistance = t;
        }
    }
    return best;
}

void CollisionManager::queryArea(const AABB& area, std::vector<BodyID>& out) const {
    out.clear();
    std::shared_lock<std::shared_mutex> lock(m_bodiesMutex);
    for (const auto& body : m_bodies) {
        if (body.aabb.intersects(area)) {
            out.push_back(body.id);
        }
    }
}

} // namespace Vantage

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_MANAGER_HPP
#define COLLISION_MANAGER_HPP

/**
 * @file CollisionManager.hpp
 * @brief Static collision world answering line-of-sight queries
 *
 * Holds static box colliders tagged with CollisionLayer bits and answers
 * raycasts against them. Queries take a shared lock, so any number of worker
 * threads may raycast concurrently; adding or removing bodies takes the
 * exclusive lock and must not race with the frame's dispatched queries if
 * deterministic results are required.
 */

#include "collisions/AABB.hpp"
#include "collisions/CollisionBody.hpp"
#include "collisions/Raycast.hpp"
#include <atomic>
#include <cstddef>
#include <shared_mutex>
#include <span>
#include <vector>

namespace Vantage {

class CollisionManager {
public:
    static CollisionManager& Instance() {
        static CollisionManager s_instance;
        return s_instance;
    }

    bool init();
    void clean();

    bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }

    /**
     * @brief Adds a static box collider
     * @param aabb World-space box
     * @param layer CollisionLayer bits the body belongs to
     * @return New body id, or UniqueID::INVALID_ID if the box is degenerate
     */
    BodyID addStaticBody(const AABB& aabb, uint32_t layer = Layer_Environment);

    bool removeBody(BodyID id);

    size_t getBodyCount() const;

    /**
     * @brief Closest hit along one ray, filtered by layer mask
     *
     * Misses return a default RaycastHit. A ray starting inside a collider
     * hits it at distance 0 on the origin.
     */
    RaycastHit raycast(const RaycastCommand& command) const;

    /**
     * @brief Evaluates commands[i] into hits[i] for every i
     *
     * Takes the shared lock once for the whole batch. hits must be at least as
     * long as commands.
     */
    void raycastBatch(std::span<const RaycastCommand> commands,
                      std::span<RaycastHit> hits) const;

    void queryArea(const AABB& area, std::vector<BodyID>& out) const;

    uint64_t getTotalRaycasts() const { return m_totalRaycasts.load(std::memory_order_relaxed); }

private:
    CollisionManager() = default;
    ~CollisionManager() = default;
    CollisionManager(const CollisionManager&) = delete;
    CollisionManager& operator=(const CollisionManager&) = delete;

    RaycastHit raycastLocked(const RaycastCommand& command) const;

    std::vector<CollisionBody> m_bodies;
    mutable std::shared_mutex m_bodiesMutex;
    std::atomic<bool> m_initialized{false};
    mutable std::atomic<uint64_t> m_totalRaycasts{0};
};

} // namespace Vantage

#endif // COLLISION_MANAGER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_DATA_MANAGER_HPP
#define ACTOR_DATA_MANAGER_HPP

/**
 * @file ActorDataManager.hpp
 * @brief Registry of actor transforms and the source of per-cycle snapshots
 *
 * Actors live in dense slots. A handle's index is its slot, so the snapshot
 * returned by getAllActors() can be indexed directly with
 * ActorHandle::getIndex(). Destroying an actor frees its slot; reusing the
 * slot bumps the generation so stale handles no longer compare equal to the
 * snapshot entry.
 */

#include "entities/ActorHandle.hpp"
#include "utils/Vector3D.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace Vantage {

class ActorDataManager {
public:
    static ActorDataManager& Instance() {
        static ActorDataManager s_instance;
        return s_instance;
    }

    bool init();
    void clean();
    bool isInitialized() const { return m_initialized.load(std::memory_order_acquire); }

    ActorHandle createActor(const Vector3D& position);
    bool destroyActor(ActorHandle handle);

    bool isValid(ActorHandle handle) const;
    bool setPosition(ActorHandle handle, const Vector3D& position);
    std::optional<Vector3D> getPosition(ActorHandle handle) const;

    size_t getActorCount() const;

    /**
     * @brief Copies every slot into out; out[i] describes slot i
     *
     * The copy is the snapshot: later moves or destroys do not affect it.
     */
    void getAllActors(std::vector<ActorData>& out) const;

private:
    ActorDataManager() = default;
    ~ActorDataManager() = default;
    ActorDataManager(const ActorDataManager&) = delete;
    ActorDataManager& operator=(const ActorDataManager&) = delete;

    struct Slot {
        Vector3D position{};
        ActorHandle::Generation generation{0};
        bool alive{false};
    };

    bool isValidLocked(ActorHandle handle) const;

    std::vector<Slot> m_slots;
    std::vector<ActorHandle::IndexType> m_freeSlots;
    size_t m_aliveCount{0};
    mutable std::shared_mutex m_mutex;
    std::atomic<bool> m_initialized{false};
};

} // namespace Vantage

#endif // ACTOR_DATA_MANAGER_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ActorDataManager.hpp"
#include "core/Logger.hpp"
#include <format>
#include <mutex>

namespace Vantage {

bool ActorDataManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_slots.clear();
        m_freeSlots.clear();
        m_aliveCount = 0;
    }
    m_initialized.store(true, std::memory_order_release);
    ACTOR_INFO("ActorDataManager initialized");
    return true;
}

void ActorDataManager::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    ACTOR_INFO(std::format("ActorDataManager cleaned ({} actors released)", m_aliveCount));
    m_slots.clear();
    m_freeSlots.clear();
    m_aliveCount = 0;
    m_initialized.store(false, std::memory_order_release);
}

ActorHandle ActorDataManager::createActor(const Vector3D& position) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);

    ActorHandle::IndexType index;
    if (!m_freeSlots.empty()) {
        index = m_freeSlots.back();
        m_freeSlots.pop_back();
    } else {
        index = static_cast<ActorHandle::IndexType>(m_slots.size());
        m_slots.emplace_back();
    }

    Slot& slot = m_slots[index];
    // Generation 0 is reserved for invalid handles
    if (++slot.generation == ActorHandle::INVALID_GENERATION) {
        slot.generation = 1;
    }
    slot.position = position;
    slot.alive = true;
    ++m_aliveCount;

    return ActorHandle(index, slot.generation);
}

bool ActorDataManager::destroyActor(ActorHandle handle) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!isValidLocked(handle)) {
        ACTOR_WARN("destroyActor called with stale handle " + handle.toString());
        return false;
    }
    m_slots[handle.getIndex()].alive = false;
    m_freeSlots.push_back(handle.getIndex());
    --m_aliveCount;
    return true;
}

bool ActorDataManager::isValid(ActorHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return isValidLocked(handle);
}

bool ActorDataManager::isValidLocked(ActorHandle handle) const {
    if (!handle.isValid() || handle.getIndex() >= m_slots.size()) {
        return false;
    }
    const Slot& slot = m_slots[handle.getIndex()];
    return slot.alive && slot.generation == handle.getGeneration();
}

bool ActorDataManager::setPosition(ActorHandle handle, const Vector3D& position) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!isValidLocked(handle)) {
        return false;
    }
    m_slots[handle.getIndex()].position = position;
    return true;
}

std::optional<Vector3D> ActorDataManager::getPosition(ActorHandle handle) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!isValidLocked(handle)) {
        return std::nullopt;
    }
    return m_slots[handle.getIndex()].position;
}

size_t ActorDataManager::getActorCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_aliveCount;
}

void ActorDataManager::getAllActors(std::vector<ActorData>& out) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    out.resize(m_slots.size());
    for (size_t i = 0; i < m_slots.size(); ++i) {
        const Slot& slot = m_slots[i];
        out[i].handle = slot.alive
            ? ActorHandle(static_cast<ActorHandle::IndexType>(i), slot.generation)
            : INVALID_ACTOR_HANDLE;
        out[i].position = slot.position;
    }
}

} // namespace Vantage

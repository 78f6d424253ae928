/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ACTOR_HANDLE_HPP
#define ACTOR_HANDLE_HPP

#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>

namespace Vantage {

/**
 * @brief Lightweight handle for referencing actors in ActorDataManager
 *
 * ActorHandle is an 8-byte value that provides:
 * - Direct slot lookup via index (the same index used by snapshots)
 * - Stale reference detection via generation counter
 *
 * Handles never own the actor. They are cheap to copy and compare, making
 * them suitable as map keys and for passing by value.
 *
 * Usage:
 *   ActorHandle guard = ActorDataManager::Instance().createActor(position);
 *   PostQueryManager::Instance().isFree(guard);
 */
struct ActorHandle {
    using IndexType = uint32_t;
    using Generation = uint16_t;

    static constexpr Generation INVALID_GENERATION = 0;

    IndexType index{0};
    Generation generation{INVALID_GENERATION};
    uint16_t padding{0};

    constexpr ActorHandle() noexcept = default;

    constexpr ActorHandle(IndexType slotIndex, Generation gen) noexcept
        : index(slotIndex), generation(gen), padding(0) {}

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return generation != INVALID_GENERATION;
    }

    [[nodiscard]] constexpr IndexType getIndex() const noexcept { return index; }
    [[nodiscard]] constexpr Generation getGeneration() const noexcept {
        return generation;
    }

    [[nodiscard]] constexpr bool
    operator==(const ActorHandle& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    [[nodiscard]] constexpr bool
    operator!=(const ActorHandle& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool
    operator<(const ActorHandle& other) const noexcept {
        if (index != other.index) return index < other.index;
        return generation < other.generation;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        // Packed in 64 bits first so the shift is defined where size_t is 32 bits
        const uint64_t packed = static_cast<uint64_t>(index) |
                                (static_cast<uint64_t>(generation) << 32);
        return std::hash<uint64_t>{}(packed);
    }

    [[nodiscard]] std::string toString() const {
        if (!isValid()) {
            return "ActorHandle::INVALID";
        }
        return std::format("ActorHandle({}:{})", index, generation);
    }
};

static_assert(sizeof(ActorHandle) == 8, "ActorHandle should be 8 bytes");

inline constexpr ActorHandle INVALID_ACTOR_HANDLE{};

/**
 * @brief Read-only per-cycle snapshot entry for one actor slot
 *
 * Dead slots carry INVALID_ACTOR_HANDLE.
 */
struct ActorData {
    ActorHandle handle{};
    Vector3D position{};
};

inline std::ostream& operator<<(std::ostream& os, const ActorHandle& handle) {
    return os << handle.toString();
}

} // namespace Vantage

namespace std {
template <>
struct hash<Vantage::ActorHandle> {
    std::size_t operator()(const Vantage::ActorHandle& handle) const noexcept {
        return handle.hash();
    }
};
} // namespace std

#endif // ACTOR_HANDLE_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RAYCAST_HPP
#define RAYCAST_HPP

#include "collisions/CollisionBody.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>

namespace Vantage {

// One line-of-sight query. direction is expected to be unit length.
struct RaycastCommand {
    Vector3D from{};
    Vector3D direction{};
    float distance{0.0f};
    uint32_t layerMask{Layer_All};
};

/**
 * @brief Result of one RaycastCommand
 *
 * A miss leaves every field at its default, so point.isZero() doubles as the
 * "nothing hit" test used by the harvesting pass.
 */
struct RaycastHit {
    Vector3D point{};
    Vector3D normal{};
    float distance{0.0f};
    BodyID bodyId{UniqueID::INVALID_ID};

    bool hasHit() const { return bodyId != UniqueID::INVALID_ID; }
};

} // namespace Vantage

#endif // RAYCAST_HPP

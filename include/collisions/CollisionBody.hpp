/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_BODY_HPP
#define COLLISION_BODY_HPP

#include "collisions/AABB.hpp"
#include "utils/UniqueID.hpp"
#include <cstdint>

namespace Vantage {

using BodyID = UniqueID::IDType;

enum CollisionLayer : uint32_t {
    Layer_Default     = 1u << 0,
    Layer_Actor       = 1u << 1,
    Layer_Environment = 1u << 2,
    Layer_Cover       = 1u << 3,
    Layer_Trigger     = 1u << 4,
    Layer_All         = 0xFFFFFFFFu,
};

// Static box collider; layer holds exactly the bits the body belongs to
struct CollisionBody {
    BodyID id{UniqueID::INVALID_ID};
    AABB aabb{};
    uint32_t layer{Layer_Default};
};

} // namespace Vantage

#endif // COLLISION_BODY_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector3D.hpp"

namespace Vantage {

struct AABB {
    Vector3D center;   // world center
    Vector3D halfSize; // half extents

    AABB() = default;
    AABB(const Vector3D& c, const Vector3D& h) : center(c), halfSize(h) {}

    Vector3D min() const { return center - halfSize; }
    Vector3D max() const { return center + halfSize; }

    bool intersects(const AABB& other) const;
    bool contains(const Vector3D& p) const;

    /**
     * @brief Slab test against a ray
     * @param origin Ray origin
     * @param direction Unit ray direction
     * @param maxDistance Ray length
     * @param outDistance Entry distance along the ray (0 if origin is inside)
     * @param outNormal Face normal at the entry point (reversed ray if inside)
     * @return true if the ray enters the box within maxDistance
     */
    bool raycast(const Vector3D& origin, const Vector3D& direction,
                 float maxDistance, float& outDistance, Vector3D& outNormal) const;
};

} // namespace Vantage

#endif // AABB_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Vantage {

namespace {
constexpr float PARALLEL_EPSILON = 1e-8f;

float axis(const Vector3D& v, int i) {
    return i == 0 ? v.getX() : (i == 1 ? v.getY() : v.getZ());
}

Vector3D axisNormal(int i, float sign) {
    return Vector3D(i == 0 ? sign : 0.0f, i == 1 ? sign : 0.0f, i == 2 ? sign : 0.0f);
}
} // namespace

bool AABB::intersects(const AABB& other) const {
    // Non-strict separation so face-touching is NOT an intersection
    const Vector3D aMin = min(), aMax = max();
    const Vector3D bMin = other.min(), bMax = other.max();
    if (aMax.getX() <= bMin.getX() || bMax.getX() <= aMin.getX()) return false;
    if (aMax.getY() <= bMin.getY() || bMax.getY() <= aMin.getY()) return false;
    if (aMax.getZ() <= bMin.getZ() || bMax.getZ() <= aMin.getZ()) return false;
    return true;
}

bool AABB::contains(const Vector3D& p) const {
    const Vector3D lo = min(), hi = max();
    return p.getX() >= lo.getX() && p.getX() <= hi.getX() &&
           p.getY() >= lo.getY() && p.getY() <= hi.getY() &&
           p.getZ() >= lo.getZ() && p.getZ() <= hi.getZ();
}

bool AABB::raycast(const Vector3D& origin, const Vector3D& direction,
                   float maxDistance, float& outDistance, Vector3D& outNormal) const {
    const Vector3D lo = min(), hi = max();
    float tEnter = 0.0f;
    float tExit = maxDistance;
    int enterAxis = -1;
    float enterSign = 0.0f;

    for (int i = 0; i < 3; ++i) {
        const float o = axis(origin, i);
        const float d = axis(direction, i);
        const float bMin = axis(lo, i);
        const float bMax = axis(hi, i);

        if (std::fabs(d) < PARALLEL_EPSILON) {
            if (o < bMin || o > bMax) {
                return false;
            }
            continue;
        }

        const float inv = 1.0f / d;
        float t0 = (bMin - o) * inv;
        float t1 = (bMax - o) * inv;
        // Entering through the min face means the outward normal points to -axis
        float sign = -1.0f;
        if (t0 > t1) {
            std::swap(t0, t1);
            sign = 1.0f;
        }

        if (t0 > tEnter) {
            tEnter = t0;
            enterAxis = i;
            enterSign = sign;
        }
        tExit = std::min(tExit, t1);
        if (tEnter > tExit) {
            return false;
        }
    }

    outDistance = tEnter;
    outNormal = enterAxis >= 0 ? axisNormal(enterAxis, enterSign) : -direction;
    return true;
}

} // namespace Vantage

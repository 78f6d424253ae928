/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/internal/FanCastKernel.hpp"
#include <algorithm>
#include <numbers>

namespace Vantage::AIInternal {

namespace {
constexpr float DEG_TO_RAD = std::numbers::pi_v<float> / 180.0f;
}

float rayAngleDegrees(float angle, size_t index, size_t length) {
    const float halfAngle = angle * 0.5f;
    const float t = length > 1
        ? static_cast<float>(index) / static_cast<float>(length - 1)
        : 0.5f;
    return -halfAngle + angle * t;
}

RaycastCommand prepareRay(const PostQueryCommand& command,
                          const ActorData& self,
                          const ActorData& target,
                          size_t index, size_t length) {
    const Vector3D baseDirection = (self.position - target.position).normalized();
    const float radians = rayAngleDegrees(command.parameters.angle, index, length) * DEG_TO_RAD;

    RaycastCommand ray;
    ray.from = target.position + command.offset;
    ray.direction = baseDirection.rotatedY(radians);
    ray.distance = command.parameters.distance;
    ray.layerMask = command.layerMask;
    return ray;
}

void prepareRays(const PostQueryCommand& command,
                 const ActorData& self,
                 const ActorData& target,
                 std::span<RaycastCommand> out,
                 size_t begin, size_t end) {
    const size_t length = out.size();
    end = std::min(end, length);
    for (size_t i = begin; i < end; ++i) {
        out[i] = prepareRay(command, self, target, i, length);
    }
}

void harvestPosts(std::span<const RaycastHit> hits, std::vector<Vector3D>& outPosts) {
    outPosts.clear();
    bool wasBlocked = false;
    for (const auto& hit : hits) {
        const bool blocked = !hit.point.isZero();
        if (blocked && !wasBlocked) {
            outPosts.push_back(hit.point);
        }
        wasBlocked = blocked;
    }
}

} // namespace Vantage::AIInternal

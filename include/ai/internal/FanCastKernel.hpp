/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FAN_CAST_KERNEL_HPP
#define FAN_CAST_KERNEL_HPP

/**
 * @file FanCastKernel.hpp
 * @brief Pure functions behind the post query
 *
 * prepareRay() maps one ray index to a RaycastCommand with no shared state,
 * so any slice of the index range can be prepared on any thread. The
 * harvesting pass turns the ordered hit array into posts.
 */

#include "ai/PostQueryCommand.hpp"
#include "collisions/Raycast.hpp"
#include "entities/ActorHandle.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <span>
#include <vector>

namespace Vantage::AIInternal {

// Rays evaluated per thread-pool task
constexpr size_t FAN_CAST_BATCH_SIZE = 32;

/**
 * @brief Angular offset of ray index from the base direction, in degrees
 *
 * Linear across [-angle/2, +angle/2] using index / (length - 1). A single ray
 * points straight along the base direction.
 */
float rayAngleDegrees(float angle, size_t index, size_t length);

RaycastCommand prepareRay(const PostQueryCommand& command,
                          const ActorData& self,
                          const ActorData& target,
                          size_t index, size_t length);

// Fills out[begin, end); out.size() is the total ray count
void prepareRays(const PostQueryCommand& command,
                 const ActorData& self,
                 const ActorData& target,
                 std::span<RaycastCommand> out,
                 size_t begin, size_t end);

/**
 * @brief Records the first point of every contiguous run of blocked rays
 *
 * A ray is blocked when its hit point is non-zero. outPosts is replaced.
 */
void harvestPosts(std::span<const RaycastHit> hits, std::vector<Vector3D>& outPosts);

} // namespace Vantage::AIInternal

#endif // FAN_CAST_KERNEL_HPP

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POST_QUERY_COMMAND_HPP
#define POST_QUERY_COMMAND_HPP

#include "collisions/CollisionBody.hpp"
#include "entities/ActorHandle.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>

namespace Vantage {

/**
 * @brief Shape of the ray fan fired around the target
 *
 * step rays per row, depth rows; all step * depth rays share one linear
 * angular sweep across [-angle/2, +angle/2] degrees.
 */
struct PostQueryParameters {
    float angle{90.0f};     // Angular spread in degrees
    float distance{10.0f};  // Ray length
    int step{8};            // Rays per row
    int depth{1};           // Number of rows

    size_t rayCount() const {
        if (step <= 0 || depth <= 0) {
            return 0;
        }
        return static_cast<size_t>(step) * static_cast<size_t>(depth);
    }
};

// One post query request, immutable once enqueued
struct PostQueryCommand {
    ActorHandle self{};           // Actor that wants posts
    ActorHandle target{};         // Actor the fan is cast around
    Vector3D offset{};            // Added to the target position to form ray origins
    uint32_t layerMask{Layer_All};
    PostQueryParameters parameters{};
};

} // namespace Vantage

#endif // POST_QUERY_COMMAND_HPP

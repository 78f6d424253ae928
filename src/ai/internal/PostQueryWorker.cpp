/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "PostQueryWorker.hpp"
#include "ai/internal/FanCastKernel.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/CollisionManager.hpp"
#include <exception>
#include <format>
#include <span>

namespace Vantage::AIInternal {

PostQueryWorkerState PostQueryWorker::getState() const {
    if (isRunning()) {
        return PostQueryWorkerState::Running;
    }
    return hasPendingCommand() ? PostQueryWorkerState::Pending : PostQueryWorkerState::Idle;
}

void PostQueryWorker::consumePending() {
    if (m_pendingCount > 0) {
        --m_pendingCount;
    }
}

void PostQueryWorker::execute(const PostQueryCommand& command, const ActorData& self,
                              const ActorData& target) {
    const size_t length = command.parameters.rayCount();
    m_inFlight = std::make_unique<InFlightQuery>(length);

    // Pool threads see the buffers only through these spans; InFlightQuery
    // keeps them alive until every job has been joined
    std::span<RaycastCommand> rays(m_inFlight->rays);
    std::span<RaycastHit> hits(m_inFlight->hits);

    auto fanCast = [command, self, target, rays, hits](size_t begin, size_t end) {
        prepareRays(command, self, target, rays, begin, end);
        CollisionManager::Instance().raycastBatch(rays.subspan(begin, end - begin),
                                                  hits.subspan(begin, end - begin));
    };

    m_inFlight->jobs = ThreadSystem::Instance().parallelFor(
        length, FAN_CAST_BATCH_SIZE, fanCast, TaskPriority::High, "PostQuery FanCast");
}

bool PostQueryWorker::complete() {
    if (!m_inFlight) {
        return false;
    }

    bool succeeded = true;
    for (auto& job : m_inFlight->jobs) {
        try {
            job.get();
        } catch (const std::exception& e) {
            POSTQUERY_ERROR(std::format("Fan cast job failed: {}", e.what()));
            succeeded = false;
        }
    }

    std::vector<Vector3D> harvested;
    if (succeeded) {
        harvestPosts(m_inFlight->hits, harvested);
    }
    m_posts.swap(harvested);
    m_inFlight.reset();
    return succeeded;
}

void PostQueryWorker::release() {
    m_inFlight.reset();
}

} // namespace Vantage::AIInternal

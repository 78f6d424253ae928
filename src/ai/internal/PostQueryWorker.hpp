/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POST_QUERY_WORKER_HPP
#define POST_QUERY_WORKER_HPP

#include "ai/PostQueryCommand.hpp"
#include "collisions/Raycast.hpp"
#include "entities/ActorHandle.hpp"
#include "managers/PostQueryManager.hpp"
#include "utils/Vector3D.hpp"
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <vector>

namespace Vantage::AIInternal {

/**
 * @brief Per-actor post query state
 *
 * Owns the actor's published posts and, while Running, the buffers of its
 * single in-flight fan cast. Only the driving thread calls into a worker;
 * the thread pool only touches the in-flight buffers, and only between
 * execute() and the join in complete()/release().
 */
class PostQueryWorker {
public:
    PostQueryWorker() = default;
    ~PostQueryWorker() = default;

    PostQueryWorker(const PostQueryWorker&) = delete;
    PostQueryWorker& operator=(const PostQueryWorker&) = delete;

    const std::vector<Vector3D>& getPosts() const { return m_posts; }

    bool isRunning() const { return m_inFlight != nullptr; }
    bool hasPendingCommand() const { return m_pendingCount > 0; }
    PostQueryWorkerState getState() const;

    // A command for this actor entered the queue
    void markPending() { ++m_pendingCount; }

    // A command for this actor left the queue, dispatched or dropped
    void consumePending();

    /**
     * @brief Idle/Pending -> Running: allocates ray and hit buffers and
     * dispatches the fan cast to the thread pool
     */
    void execute(const PostQueryCommand& command, const ActorData& self, const ActorData& target);

    /**
     * @brief Running -> Idle: joins the fan cast, publishes the harvested
     * posts and releases the buffers
     * @return false if the job failed; the published posts are then empty
     */
    bool complete();

    // Joins and releases any in-flight job without publishing results
    void release();

private:
    /**
     * @brief Buffers and job futures of one dispatched fan cast
     *
     * Destruction waits for every job first, so the buffers are never freed
     * while a pool thread may still write to them, whichever path drops the
     * query.
     */
    struct InFlightQuery {
        explicit InFlightQuery(size_t rayCount) : rays(rayCount), hits(rayCount) {}
        ~InFlightQuery() { waitAll(); }

        InFlightQuery(const InFlightQuery&) = delete;
        InFlightQuery& operator=(const InFlightQuery&) = delete;

        void waitAll() {
            for (auto& job : jobs) {
                if (job.valid()) {
                    job.wait();
                }
            }
        }

        std::vector<RaycastCommand> rays;
        std::vector<RaycastHit> hits;
        std::vector<std::future<void>> jobs;
    };

    std::vector<Vector3D> m_posts;
    std::unique_ptr<InFlightQuery> m_inFlight;
    uint32_t m_pendingCount{0};
};

} // namespace Vantage::AIInternal

#endif // POST_QUERY_WORKER_HPP

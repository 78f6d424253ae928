/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POST_QUERY_MANAGER_HPP
#define POST_QUERY_MANAGER_HPP

/**
 * @file PostQueryManager.hpp
 * @brief Amortized tactical post search for AI actors
 *
 * Callers enqueue PostQueryCommands. Every framesPerTick frames the Consume
 * tick takes an actor snapshot and dispatches at most maxWorkerCount queued
 * commands to the thread pool as fan casts. COMPLETE_DELAY_FRAMES frames later
 * the Complete tick joins that batch and publishes each actor's posts.
 *
 * Each actor gets one worker on its first command. A worker runs at most one
 * fan cast at a time; a command that reaches Consume while its actor's worker
 * is still running is dropped with a warning.
 *
 * Threading: enqueueCommand(), the accessors and both ticks belong to the
 * driving thread (the one calling FrameScheduler::update()). Only the fan cast
 * itself runs on ThreadSystem workers. The two setters may be called from any
 * thread and take effect from the next Consume tick.
 */

#include "ai/PostQueryCommand.hpp"
#include "core/FrameScheduler.hpp"
#include "entities/ActorHandle.hpp"
#include "utils/Vector3D.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Vantage {

namespace AIInternal {
class PostQueryWorker;
}

enum class PostQueryWorkerState : uint8_t {
    Idle,     // No command queued, no fan cast in flight
    Pending,  // At least one command queued
    Running   // Fan cast dispatched, waiting for Complete
};

struct PostQueryStats {
    uint64_t totalEnqueued{0};
    uint64_t totalDispatched{0};
    uint64_t totalCompleted{0};
    uint64_t busyDrops{0};
    uint64_t invalidDrops{0};
    size_t queueSize{0};
    size_t workerCount{0};
    size_t lastBatchSize{0};
    uint64_t consumeCycles{0};
    double averageConsumeTimeMs{0.0};
    double averageCompleteTimeMs{0.0};
};

class PostQueryManager {
public:
    static constexpr int DEFAULT_WORKER_COUNT = 5;
    static constexpr int DEFAULT_FRAMES_PER_TICK = 25;
    // Frames between a Consume tick and the Complete tick harvesting its batch
    static constexpr int COMPLETE_DELAY_FRAMES = 3;

    static PostQueryManager& Instance() {
        static PostQueryManager s_instance;
        return s_instance;
    }

    /**
     * @brief Reads the "postquery" settings and schedules both ticks
     * @return false if frames_per_tick <= COMPLETE_DELAY_FRAMES or
     *         max_worker_count < 1
     */
    bool init();

    /**
     * @brief Cancels both ticks, joins every in-flight fan cast and drops all
     * workers and queued commands
     */
    void clean();

    bool isInitialized() const { return m_initialized; }

    /**
     * @brief Queues a command and marks its actor's worker Pending
     * @return false if the manager is not initialized
     */
    bool enqueueCommand(const PostQueryCommand& command);

    // Posts from the actor's last completed query; empty for unknown actors
    const std::vector<Vector3D>& getPosts(ActorHandle actor) const;

    // True when the actor has nothing queued and nothing in flight
    bool isFree(ActorHandle actor) const;

    PostQueryWorkerState getWorkerState(ActorHandle actor) const;

    bool setMaxWorkerCount(int count);
    bool setFramesPerTick(int frames);
    int getMaxWorkerCount() const { return m_maxWorkerCount.load(std::memory_order_relaxed); }
    int getFramesPerTick() const { return m_framesPerTick.load(std::memory_order_relaxed); }

    size_t getQueueSize() const { return m_commandQueue.size(); }
    size_t getWorkerCount() const { return m_workers.size(); }

    PostQueryStats getStats() const;
    void resetStats();

private:
    PostQueryManager();
    ~PostQueryManager();
    PostQueryManager(const PostQueryManager&) = delete;
    PostQueryManager& operator=(const PostQueryManager&) = delete;

    void consumeCommands();
    void completeCommands();
    void applySetting(const std::string& key, int value);

    // Snapshot entry for handle, or nullptr if the actor is gone
    const ActorData* findActor(ActorHandle handle) const;

    std::unordered_map<ActorHandle, std::unique_ptr<AIInternal::PostQueryWorker>> m_workers;
    std::deque<PostQueryCommand> m_commandQueue;
    std::vector<ActorHandle> m_batch;
    std::vector<ActorData> m_snapshot;

    TimerHandle m_consumeTimer;
    TimerHandle m_completeTimer;

    std::atomic<int> m_maxWorkerCount{DEFAULT_WORKER_COUNT};
    std::atomic<int> m_framesPerTick{DEFAULT_FRAMES_PER_TICK};
    std::atomic<bool> m_intervalDirty{false};

    PostQueryStats m_stats;
    uint64_t m_completeCycles{0};
    double m_totalConsumeTimeMs{0.0};
    double m_totalCompleteTimeMs{0.0};

    size_t m_settingsListenerId{0};
    bool m_listenerRegistered{false};
    bool m_initialized{false};
};

} // namespace Vantage

#endif // POST_QUERY_MANAGER_HPP

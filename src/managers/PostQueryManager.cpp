/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PostQueryManager.hpp"
#include "ai/internal/PostQueryWorker.hpp"
#include "core/Logger.hpp"
#include "core/ThreadSystem.hpp"
#include "managers/ActorDataManager.hpp"
#include "managers/CollisionManager.hpp"
#include "managers/SettingsManager.hpp"
#include <chrono>
#include <format>

namespace Vantage {

namespace {
constexpr const char* SETTINGS_CATEGORY = "postquery";
constexpr const char* KEY_MAX_WORKER_COUNT = "max_worker_count";
constexpr const char* KEY_FRAMES_PER_TICK = "frames_per_tick";

// Absent keys keep `value`; present keys must hold a whole number
bool readWholeNumber(const char* key, int& value) {
    const auto stored = SettingsManager::Instance().getValue(SETTINGS_CATEGORY, key);
    if (!stored) {
        return true;
    }
    const auto whole = SettingsManager::toWholeInt(*stored);
    if (!whole) {
        POSTQUERY_ERROR(std::format("Setting {}.{} must be a whole number in int range",
                                    SETTINGS_CATEGORY, key));
        return false;
    }
    value = *whole;
    return true;
}

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}
} // namespace

PostQueryManager::PostQueryManager() {
    // Constructed first so they are destroyed after this manager's timers and jobs
    FrameScheduler::Instance();
    ThreadSystem::Instance();
    CollisionManager::Instance();
}

PostQueryManager::~PostQueryManager() {
    if (m_initialized) {
        clean();
    }
}

bool PostQueryManager::init() {
    if (m_initialized) {
        return true;
    }

    int maxWorkerCount = DEFAULT_WORKER_COUNT;
    int framesPerTick = DEFAULT_FRAMES_PER_TICK;
    if (!readWholeNumber(KEY_MAX_WORKER_COUNT, maxWorkerCount) ||
        !readWholeNumber(KEY_FRAMES_PER_TICK, framesPerTick)) {
        POSTQUERY_CRITICAL("Invalid postquery settings");
        return false;
    }

    // Complete must harvest a batch before the next Consume can reuse its workers
    if (framesPerTick <= COMPLETE_DELAY_FRAMES) {
        POSTQUERY_CRITICAL(std::format("frames_per_tick must be greater than {} (got {})",
                                       COMPLETE_DELAY_FRAMES, framesPerTick));
        return false;
    }
    if (maxWorkerCount < 1) {
        POSTQUERY_CRITICAL(std::format("max_worker_count must be at least 1 (got {})", maxWorkerCount));
        return false;
    }

    m_maxWorkerCount.store(maxWorkerCount, std::memory_order_relaxed);
    m_framesPerTick.store(framesPerTick, std::memory_order_relaxed);
    m_intervalDirty.store(false, std::memory_order_relaxed);

    auto& scheduler = FrameScheduler::Instance();
    m_consumeTimer = scheduler.waitFrame(static_cast<uint32_t>(framesPerTick),
                                         [this](uint64_t) { consumeCommands(); },
                                         true);
    m_completeTimer = scheduler.waitFrame(static_cast<uint32_t>(COMPLETE_DELAY_FRAMES),
                                          [this](uint64_t) { completeCommands(); },
                                          true, true);
    if (!m_consumeTimer.isValid() || !m_completeTimer.isValid()) {
        POSTQUERY_CRITICAL("Failed to schedule post query ticks");
        m_consumeTimer.reset();
        m_completeTimer.reset();
        return false;
    }

    m_settingsListenerId = SettingsManager::Instance().registerChangeListener(
        SETTINGS_CATEGORY,
        [this](const std::string&, const std::string& key, const SettingsManager::SettingValue& value) {
            if (key != KEY_MAX_WORKER_COUNT && key != KEY_FRAMES_PER_TICK) {
                return;
            }
            if (const auto whole = SettingsManager::toWholeInt(value)) {
                applySetting(key, *whole);
            } else {
                POSTQUERY_ERROR(std::format("Rejected postquery.{}: must be a whole number in int range", key));
            }
        });
    m_listenerRegistered = true;

    resetStats();
    m_initialized = true;

    POSTQUERY_INFO(std::format("PostQueryManager initialized (max workers per tick: {}, frames per tick: {})",
                               maxWorkerCount, framesPerTick));
    return true;
}

void PostQueryManager::clean() {
    if (!m_initialized) {
        return;
    }

    m_consumeTimer.reset();
    m_completeTimer.reset();

    if (m_listenerRegistered) {
        SettingsManager::Instance().unregisterChangeListener(m_settingsListenerId);
        m_listenerRegistered = false;
    }

    size_t inFlight = 0;
    for (auto& [handle, worker] : m_workers) {
        if (worker->isRunning()) {
            ++inFlight;
        }
        worker->release();
    }
    if (inFlight > 0) {
        POSTQUERY_INFO(std::format("Joined {} in-flight post queries during shutdown", inFlight));
    }

    m_workers.clear();
    m_commandQueue.clear();
    m_batch.clear();
    m_snapshot.clear();
    m_initialized = false;

    POSTQUERY_INFO("PostQueryManager cleaned");
}

bool PostQueryManager::enqueueCommand(const PostQueryCommand& command) {
    if (!m_initialized) {
        POSTQUERY_ERROR("enqueueCommand called before init()");
        return false;
    }

    auto& worker = m_workers[command.self];
    if (!worker) {
        worker = std::make_unique<AIInternal::PostQueryWorker>();
    }
    worker->markPending();
    m_commandQueue.push_back(command);
    ++m_stats.totalEnqueued;
    return true;
}

const std::vector<Vector3D>& PostQueryManager::getPosts(ActorHandle actor) const {
    static const std::vector<Vector3D> s_noPosts;
    auto it = m_workers.find(actor);
    return it != m_workers.end() ? it->second->getPosts() : s_noPosts;
}

bool PostQueryManager::isFree(ActorHandle actor) const {
    return getWorkerState(actor) == PostQueryWorkerState::Idle;
}

PostQueryWorkerState PostQueryManager::getWorkerState(ActorHandle actor) const {
    auto it = m_workers.find(actor);
    return it != m_workers.end() ? it->second->getState() : PostQueryWorkerState::Idle;
}

bool PostQueryManager::setMaxWorkerCount(int count) {
    if (count < 1) {
        POSTQUERY_ERROR(std::format("Rejected max worker count {}: must be at least 1", count));
        return false;
    }
    m_maxWorkerCount.store(count, std::memory_order_relaxed);
    return true;
}

bool PostQueryManager::setFramesPerTick(int frames) {
    if (frames <= COMPLETE_DELAY_FRAMES) {
        POSTQUERY_ERROR(std::format("Rejected frames per tick {}: must be greater than {}",
                                    frames, COMPLETE_DELAY_FRAMES));
        return false;
    }
    if (m_framesPerTick.exchange(frames, std::memory_order_relaxed) != frames) {
        m_intervalDirty.store(true, std::memory_order_release);
    }
    return true;
}

PostQueryStats PostQueryManager::getStats() const {
    PostQueryStats stats = m_stats;
    stats.queueSize = m_commandQueue.size();
    stats.workerCount = m_workers.size();
    stats.averageConsumeTimeMs =
        stats.consumeCycles > 0 ? m_totalConsumeTimeMs / static_cast<double>(stats.consumeCycles) : 0.0;
    stats.averageCompleteTimeMs =
        m_completeCycles > 0 ? m_totalCompleteTimeMs / static_cast<double>(m_completeCycles) : 0.0;
    return stats;
}

void PostQueryManager::resetStats() {
    m_stats = PostQueryStats{};
    m_completeCycles = 0;
    m_totalConsumeTimeMs = 0.0;
    m_totalCompleteTimeMs = 0.0;
}

void PostQueryManager::applySetting(const std::string& key, int value) {
    if (key == KEY_MAX_WORKER_COUNT) {
        setMaxWorkerCount(value);
    } else if (key == KEY_FRAMES_PER_TICK) {
        setFramesPerTick(value);
    }
}

const ActorData* PostQueryManager::findActor(ActorHandle handle) const {
    if (!handle.isValid() || handle.getIndex() >= m_snapshot.size()) {
        return nullptr;
    }
    const ActorData& entry = m_snapshot[handle.getIndex()];
    return entry.handle == handle ? &entry : nullptr;
}

void PostQueryManager::consumeCommands() {
    const auto start = std::chrono::steady_clock::now();

    ActorDataManager::Instance().getAllActors(m_snapshot);

    const size_t maxDispatches = static_cast<size_t>(m_maxWorkerCount.load(std::memory_order_relaxed));
    m_batch.clear();

    while (m_batch.size() < maxDispatches && !m_commandQueue.empty()) {
        PostQueryCommand command = m_commandQueue.front();
        m_commandQueue.pop_front();

        auto it = m_workers.find(command.self);
        if (it == m_workers.end()) {
            ++m_stats.invalidDrops;
            continue;
        }
        AIInternal::PostQueryWorker& worker = *it->second;
        worker.consumePending();

        if (worker.isRunning()) {
            POSTQUERY_WARN(std::format("Dropped command for {}: previous query has not completed",
                                       command.self.toString()));
            ++m_stats.busyDrops;
            continue;
        }

        const ActorData* self = findActor(command.self);
        const ActorData* target = findActor(command.target);
        if (self == nullptr || target == nullptr) {
            POSTQUERY_WARN(std::format("Dropped command for {}: {} is not a live actor",
                                       command.self.toString(),
                                       self == nullptr ? "self" : "target"));
            ++m_stats.invalidDrops;
            continue;
        }
        if (command.parameters.rayCount() == 0) {
            POSTQUERY_WARN(std::format("Dropped command for {}: step and depth must be positive",
                                       command.self.toString()));
            ++m_stats.invalidDrops;
            continue;
        }

        worker.execute(command, *self, *target);
        m_batch.push_back(command.self);
        ++m_stats.totalDispatched;
    }

    m_stats.lastBatchSize = m_batch.size();
    ++m_stats.consumeCycles;

    if (!m_batch.empty()) {
        m_completeTimer.resume();
        POSTQUERY_DEBUG(std::format("Dispatched {} post queries, {} still queued",
                                    m_batch.size(), m_commandQueue.size()));
    }

    if (m_intervalDirty.exchange(false, std::memory_order_acquire)) {
        const int framesPerTick = m_framesPerTick.load(std::memory_order_relaxed);
        m_consumeTimer.setInterval(static_cast<uint32_t>(framesPerTick));
        POSTQUERY_INFO(std::format("Consume interval changed to {} frames", framesPerTick));
    }

    m_totalConsumeTimeMs += elapsedMs(start);
}

void PostQueryManager::completeCommands() {
    const auto start = std::chrono::steady_clock::now();

    for (ActorHandle handle : m_batch) {
        auto it = m_workers.find(handle);
        if (it == m_workers.end()) {
            continue;
        }
        if (it->second->complete()) {
            ++m_stats.totalCompleted;
        } else {
            POSTQUERY_ERROR(std::format("Post query for {} failed, posts cleared", handle.toString()));
        }
    }
    m_batch.clear();
    m_completeTimer.pause();

    ++m_completeCycles;
    m_totalCompleteTimeMs += elapsedMs(start);
}

} // namespace Vantage

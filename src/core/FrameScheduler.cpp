/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/FrameScheduler.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <format>

namespace Vantage {

FrameScheduler::TimerHandle FrameScheduler::waitFrame(uint32_t frames, TimerCallback callback,
                                                      bool looped, bool startPaused) {
    if (!callback) {
        SCHEDULER_ERROR("waitFrame called without a callback");
        return TimerHandle{};
    }

    Timer timer;
    timer.callback = std::move(callback);
    timer.interval = std::max<uint32_t>(frames, 1);
    timer.remaining = timer.interval;
    timer.armedFrame = m_frameCount;
    timer.looped = looped;
    timer.paused = startPaused;

    const TimerId id = m_nextId++;
    m_timers.emplace(id, std::move(timer));
    return TimerHandle(this, id);
}

void FrameScheduler::update() {
    if (m_inUpdate) {
        SCHEDULER_ERROR("Re-entrant update() ignored");
        return;
    }
    m_inUpdate = true;
    ++m_frameCount;

    // Callbacks may add or remove timers, so walk a copy of the ids
    m_dueScratch.clear();
    m_dueScratch.reserve(m_timers.size());
    for (const auto& [id, timer] : m_timers) {
        m_dueScratch.push_back(id);
    }

    for (TimerId id : m_dueScratch) {
        auto it = m_timers.find(id);
        if (it == m_timers.end()) {
            continue;
        }
        Timer& timer = it->second;
        if (timer.paused || timer.armedFrame == m_frameCount) {
            continue;
        }
        if (--timer.remaining > 0) {
            continue;
        }

        if (timer.looped) {
            timer.remaining = timer.interval;
        }

        // Copy: the callback may cancel its own timer
        TimerCallback callback = timer.callback;
        const bool looped = timer.looped;
        try {
            callback(m_frameCount);
        } catch (const std::exception& e) {
            SCHEDULER_ERROR(std::format("Timer {} callback threw: {}", id, e.what()));
        }

        if (!looped) {
            m_timers.erase(id);
        }
    }

    m_inUpdate = false;
}

bool FrameScheduler::pause(TimerId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return false;
    }
    it->second.paused = true;
    return true;
}

bool FrameScheduler::resume(TimerId id) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return false;
    }
    Timer& timer = it->second;
    timer.paused = false;
    timer.remaining = timer.interval;
    timer.armedFrame = m_frameCount;
    return true;
}

bool FrameScheduler::cancel(TimerId id) {
    return m_timers.erase(id) > 0;
}

bool FrameScheduler::setInterval(TimerId id, uint32_t frames) {
    auto it = m_timers.find(id);
    if (it == m_timers.end()) {
        return false;
    }
    Timer& timer = it->second;
    timer.interval = std::max<uint32_t>(frames, 1);
    timer.remaining = timer.interval;
    timer.armedFrame = m_frameCount;
    return true;
}

bool FrameScheduler::isActive(TimerId id) const {
    return m_timers.find(id) != m_timers.end();
}

bool FrameScheduler::isPaused(TimerId id) const {
    auto it = m_timers.find(id);
    return it != m_timers.end() && it->second.paused;
}

void FrameScheduler::clean() {
    if (!m_timers.empty()) {
        SCHEDULER_INFO(std::format("FrameScheduler cleaned ({} timers cancelled)", m_timers.size()));
    }
    m_timers.clear();
    m_dueScratch.clear();
}

} // namespace Vantage

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FRAME_SCHEDULER_HPP
#define FRAME_SCHEDULER_HPP

/**
 * @file FrameScheduler.hpp
 * @brief Frame-counted timers for low-frequency periodic work
 *
 * The driving sequence calls update() once per simulation frame. Timers
 * count frames down and invoke their callback on the frame they reach zero;
 * looped timers then restart. Callbacks run on the driving thread and may
 * pause, resume, cancel or create timers, including other timers that are
 * due in the same frame.
 *
 * Not thread-safe: every call must come from the driving thread.
 */

#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <functional>
#include <vector>

namespace Vantage {

class FrameScheduler {
public:
    using TimerId = uint64_t;
    using TimerCallback = std::function<void(uint64_t frame)>;

    static constexpr TimerId INVALID_TIMER = 0;

    /**
     * @brief Owning reference to a scheduled timer
     *
     * Move-only. Destroying or resetting the handle cancels the timer, so a
     * system holding its timers as members cannot leave callbacks behind.
     */
    class TimerHandle {
    public:
        TimerHandle() = default;
        TimerHandle(FrameScheduler* scheduler, TimerId id) : m_scheduler(scheduler), m_id(id) {}
        ~TimerHandle() { reset(); }

        TimerHandle(const TimerHandle&) = delete;
        TimerHandle& operator=(const TimerHandle&) = delete;

        TimerHandle(TimerHandle&& other) noexcept
            : m_scheduler(other.m_scheduler), m_id(other.m_id) {
            other.m_scheduler = nullptr;
            other.m_id = INVALID_TIMER;
        }

        TimerHandle& operator=(TimerHandle&& other) noexcept {
            if (this != &other) {
                reset();
                m_scheduler = other.m_scheduler;
                m_id = other.m_id;
                other.m_scheduler = nullptr;
                other.m_id = INVALID_TIMER;
            }
            return *this;
        }

        bool isValid() const { return m_scheduler != nullptr && m_scheduler->isActive(m_id); }
        TimerId getId() const { return m_id; }

        bool pause() { return m_scheduler && m_scheduler->pause(m_id); }
        bool resume() { return m_scheduler && m_scheduler->resume(m_id); }
        bool setInterval(uint32_t frames) { return m_scheduler && m_scheduler->setInterval(m_id, frames); }
        bool isPaused() const { return m_scheduler && m_scheduler->isPaused(m_id); }

        void reset() {
            if (m_scheduler != nullptr) {
                m_scheduler->cancel(m_id);
            }
            m_scheduler = nullptr;
            m_id = INVALID_TIMER;
        }

    private:
        FrameScheduler* m_scheduler{nullptr};
        TimerId m_id{INVALID_TIMER};
    };

    static FrameScheduler& Instance() {
        static FrameScheduler s_instance;
        return s_instance;
    }

    /**
     * @brief Schedules callback to run after frames updates
     * @param frames Frames to wait (minimum 1)
     * @param callback Invoked with the current frame number
     * @param looped Restart the countdown after every invocation
     * @param startPaused Create the timer paused; resume() starts the countdown
     */
    TimerHandle waitFrame(uint32_t frames, TimerCallback callback,
                          bool looped = false, bool startPaused = false);

    // Advances one frame and fires every due timer
    void update();

    bool pause(TimerId id);

    // Unpauses and restarts the countdown from the full interval
    bool resume(TimerId id);

    bool cancel(TimerId id);

    // Changes the interval and restarts the countdown
    bool setInterval(TimerId id, uint32_t frames);

    bool isActive(TimerId id) const;
    bool isPaused(TimerId id) const;

    uint64_t getFrameCount() const { return m_frameCount; }
    size_t getTimerCount() const { return m_timers.size(); }

    // Cancels every timer; outstanding handles become inert
    void clean();

private:
    FrameScheduler() = default;
    ~FrameScheduler() = default;
    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    struct Timer {
        TimerCallback callback;
        uint32_t interval{1};
        uint32_t remaining{1};
        // Frame in which the countdown was (re)started; it does not tick in that frame
        uint64_t armedFrame{0};
        bool looped{false};
        bool paused{false};
    };

    boost::container::flat_map<TimerId, Timer> m_timers;
    std::vector<TimerId> m_dueScratch;
    TimerId m_nextId{1};
    uint64_t m_frameCount{0};
    bool m_inUpdate{false};
};

using TimerHandle = FrameScheduler::TimerHandle;

} // namespace Vantage

#endif // FRAME_SCHEDULER_HPP

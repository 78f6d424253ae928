/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: prioritized worker pool used as the data-parallel executor
 * for spatial queries
 */

#ifndef VANTAGE_THREAD_SYSTEM_HPP
#define VANTAGE_THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <format>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__) || defined(__APPLE__)
#include <pthread.h>
#endif

namespace Vantage {

enum class TaskPriority {
  Critical = 0, // Must execute ASAP
  High = 1,     // Frame-bound work, e.g. fan casts awaiting harvest
  Normal = 2,   // Default
  Low = 3,      // Background work
  Idle = 4      // Only when nothing else is pending
};

struct PrioritizedTask {
  std::function<void()> task;
  std::string description;
};

/**
 * @brief Blocking multi-priority FIFO
 *
 * pop() always serves the highest non-empty priority; equal priorities are
 * served in push order.
 */
class TaskQueue {
public:
  static constexpr size_t PRIORITY_COUNT = static_cast<size_t>(TaskPriority::Idle) + 1;

  void push(std::function<void()> task, TaskPriority priority,
            const std::string &description) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_queues[index(priority)].push_back({std::move(task), description});
      ++m_size;
      ++m_totalEnqueued;
    }
    m_ready.notify_one();
  }

  void pushBatch(std::vector<std::function<void()>> &tasks,
                 TaskPriority priority, const std::string &description) {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto &queue = m_queues[index(priority)];
      for (auto &task : tasks) {
        queue.push_back({std::move(task), description});
      }
      m_size += tasks.size();
      m_totalEnqueued += tasks.size();
    }
    tasks.clear();
    m_ready.notify_all();
  }

  // Blocks until a task is available; false once the queue is stopped
  bool pop(PrioritizedTask &out) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_ready.wait(lock, [this] { return m_stopped || m_size > 0; });
    if (m_stopped) {
      return false;
    }
    for (auto &queue : m_queues) {
      if (!queue.empty()) {
        out = std::move(queue.front());
        queue.pop_front();
        --m_size;
        return true;
      }
    }
    return false;
  }

  // Wakes every waiter and discards queued tasks; their futures report broken_promise
  void stop() {
    std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> discarded;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_stopped = true;
      discarded.swap(m_queues);
      m_size = 0;
    }
    m_ready.notify_all();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_size;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalEnqueued;
  }

private:
  static size_t index(TaskPriority priority) {
    return std::min(static_cast<size_t>(priority), PRIORITY_COUNT - 1);
  }

  mutable std::mutex m_mutex;
  std::condition_variable m_ready;
  std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> m_queues;
  size_t m_size{0};
  size_t m_totalEnqueued{0};
  bool m_stopped{false};
};

class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] { workerLoop(i); });
    }
  }

  // Joins every worker; tasks still queued are discarded
  ~ThreadPool() {
    m_queue.stop();
    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO(std::format("ThreadPool joined {} workers", m_workers.size()));
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task, TaskPriority priority,
               const std::string &description) {
    m_queue.push(std::move(task), priority, description);
  }

  void batchEnqueue(std::vector<std::function<void()>> &tasks,
                    TaskPriority priority, const std::string &description) {
    m_queue.pushBatch(tasks, priority, description);
  }

  /**
   * @brief Enqueues f(args...) and returns a future for its result
   *
   * Exceptions thrown by f are stored in the future.
   */
  template <class F, class... Args>
  auto enqueueWithResult(F &&f, TaskPriority priority,
                         const std::string &description, Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<ResultType> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  bool busy() const {
    return m_queue.size() > 0 || m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  size_t getQueueSize() const { return m_queue.size(); }
  size_t getTotalTasksEnqueued() const { return m_queue.getTotalTasksEnqueued(); }
  size_t getTotalTasksProcessed() const {
    return m_totalProcessed.load(std::memory_order_relaxed);
  }

private:
  void workerLoop(size_t workerIndex) {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), std::format("Vantage-{}", workerIndex).c_str());
#elif defined(__APPLE__)
    pthread_setname_np(std::format("Vantage-{}", workerIndex).c_str());
#endif
    PrioritizedTask next;
    while (m_queue.pop(next)) {
      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      const auto start = std::chrono::steady_clock::now();
      try {
        next.task();
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR(std::format("Task '{}' on worker {} threw: {}",
                                       next.description, workerIndex, e.what()));
      } catch (...) {
        THREADSYSTEM_ERROR(std::format("Task '{}' on worker {} threw a non-standard exception",
                                       next.description, workerIndex));
      }
      const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
      if (elapsedMs > SLOW_TASK_MS) {
        THREADSYSTEM_WARN(std::format("Slow task '{}' on worker {}: {}ms",
                                      next.description, workerIndex, elapsedMs));
      }
      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);
      m_totalProcessed.fetch_add(1, std::memory_order_relaxed);
      next = PrioritizedTask{};
    }
  }

  static constexpr long long SLOW_TASK_MS = 100;

  TaskQueue m_queue;
  std::vector<std::thread> m_workers;
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalProcessed{0};
};

/**
 * @brief Process-wide worker pool
 *
 * init() once at startup, clean() once at shutdown; a cleaned ThreadSystem
 * cannot be restarted. parallelFor() keeps working after clean() by running
 * the body inline.
 */
class ThreadSystem {
public:
  static constexpr size_t DEFAULT_QUEUE_CAPACITY = 4096;

  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  /**
   * @param queueCapacity Logged hint for the expected task volume
   * @param customThreadCount Worker count, 0 for hardware_concurrency - 1
   * @return false if the system was already shut down or threads failed to start
   */
  bool init(size_t queueCapacity = DEFAULT_QUEUE_CAPACITY,
            unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      // Leave one core to the driving thread
      const unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = hardwareThreads > 1 ? hardwareThreads - 1 : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
    } catch (const std::system_error &e) {
      THREADSYSTEM_CRITICAL(std::format("Failed to start worker threads: {}", e.what()));
      return false;
    }
    THREADSYSTEM_INFO(std::format("ThreadSystem initialized with {} workers (queue hint {})",
                                  m_numThreads, queueCapacity));
    return true;
  }

  void clean() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    m_isShutdown.store(true, std::memory_order_release);
    if (!m_threadPool) {
      return;
    }
    const size_t pending = m_threadPool->getQueueSize();
    if (pending > 0) {
      THREADSYSTEM_INFO(std::format("Discarding {} queued tasks during shutdown", pending));
    }
    m_threadPool.reset();
    THREADSYSTEM_INFO("ThreadSystem shut down");
  }

  ~ThreadSystem() { clean(); }

  bool isRunning() const {
    return !m_isShutdown.load(std::memory_order_acquire) && m_threadPool != nullptr;
  }

  bool isShutdown() const { return m_isShutdown.load(std::memory_order_acquire); }

  void enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    if (!isRunning()) {
      THREADSYSTEM_WARN("Task rejected, ThreadSystem not running: " + description);
      return;
    }
    m_threadPool->enqueue(std::move(task), priority, description);
  }

  void batchEnqueueTasks(std::vector<std::function<void()>> &tasks,
                         TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "") {
    if (tasks.empty()) {
      return;
    }
    if (!isRunning()) {
      THREADSYSTEM_WARN(std::format("{} tasks rejected, ThreadSystem not running", tasks.size()));
      return;
    }
    m_threadPool->batchEnqueue(tasks, priority, description);
  }

  /**
   * @throws std::runtime_error if the ThreadSystem is not running
   */
  template <class F, class... Args>
  auto enqueueTaskWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "", Args &&...args)
      -> std::future<std::invoke_result_t<F, Args...>> {
    if (!isRunning()) {
      throw std::runtime_error("ThreadSystem is not running: " + description);
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority, description,
                                           std::forward<Args>(args)...);
  }

  /**
   * @brief Runs body(begin, end) over [0, count) in chunks of batchSize
   *
   * Returns one future per chunk, in chunk order. Every future must be waited
   * on before the data the body touches is released. When the pool is not
   * running the chunks run inline and the futures are already ready.
   */
  std::vector<std::future<void>>
  parallelFor(size_t count, size_t batchSize,
              const std::function<void(size_t, size_t)> &body,
              TaskPriority priority = TaskPriority::High,
              const std::string &description = "") {
    std::vector<std::future<void>> futures;
    if (count == 0) {
      return futures;
    }
    batchSize = std::max<size_t>(batchSize, 1);
    futures.reserve((count + batchSize - 1) / batchSize);

    const bool pooled = isRunning();
    for (size_t begin = 0; begin < count; begin += batchSize) {
      const size_t end = std::min(begin + batchSize, count);
      if (pooled) {
        futures.push_back(m_threadPool->enqueueWithResult(
            [body, begin, end]() { body(begin, end); }, priority, description));
      } else {
        std::packaged_task<void()> chunk([&body, begin, end]() { body(begin, end); });
        futures.push_back(chunk.get_future());
        chunk();
      }
    }
    return futures;
  }

  bool isBusy() const { return isRunning() && m_threadPool->busy(); }

  unsigned int getThreadCount() const { return m_numThreads; }

  size_t getQueueSize() const { return m_threadPool ? m_threadPool->getQueueSize() : 0; }

  size_t getTotalTasksProcessed() const {
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    return m_threadPool ? m_threadPool->getTotalTasksEnqueued() : 0;
  }

private:
  ThreadSystem() = default;
  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  std::unique_ptr<ThreadPool> m_threadPool;
  std::mutex m_lifecycleMutex;
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
};

} // namespace Vantage

#endif // VANTAGE_THREAD_SYSTEM_HPP

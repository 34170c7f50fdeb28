/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file dispatcher.hpp
 * @brief Single-consumer serial executor for worker events.
 *
 * @details
 * This header defines the `Dispatcher` class, the execution context on which every inbound
 * worker event is processed. The worker's stdout and stderr are drained by independent
 * reader threads; funnelling both through one FIFO consumer gives the connection state
 * machine and the pending request table a single logical reader, in arrival order.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace sqlbridge::infra {

/**
 * @class Dispatcher
 * @brief A FIFO task queue served by exactly one worker thread.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `post()` a task; posting never blocks on task execution.
 * - **Consumer:** One thread executes tasks strictly in posting order.
 *
 * Tasks that throw a `std::exception` are logged and do not stop the consumer.
 */
class Dispatcher {
  public:
    /**
     * @brief Spawns the consumer thread.
     */
    Dispatcher();

    /**
     * @brief Destructor. Drains pending tasks and joins the consumer.
     */
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /**
     * @brief Appends a task to the queue.
     *
     * Tasks posted after `stop()` are discarded.
     *
     * @param task The unit of work.
     * @return true if the task was queued.
     */
    bool post(std::function<void()> task);

    /**
     * @brief Blocks until every task posted before this call has executed.
     *
     * Returns immediately when called from the consumer thread itself, where waiting
     * would deadlock.
     */
    void wait_idle();

    /**
     * @brief Stops accepting tasks, runs what is queued, and joins the consumer.
     *
     * When invoked from a task (the consumer thread), the thread is detached instead of
     * joined and finishes the queue on its own. The object itself must outlive that
     * thread, so a dispatcher may not be destroyed from one of its own tasks.
     */
    void stop();

    /// @brief Returns true when the calling thread is the consumer thread.
    bool on_dispatch_thread() const;

  private:
    void run();

    std::thread worker_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;

    /// @brief Set once by `stop()`; the consumer exits after draining.
    std::atomic<bool> stop_;

    /// @brief Number of tasks queued or running, used by `wait_idle()`.
    std::size_t in_flight_;
    std::condition_variable idle_;
};

} // namespace sqlbridge::infra

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
 * @file dispatcher.cpp
 * @brief Implementation of the serial event executor.
 *
 * @details
 * The consumer loop follows the classic producer-consumer pattern: it sleeps on a
 * condition variable until a task is queued or a shutdown is requested, moves the task
 * out under the lock, and executes it with the lock released.
 */

#include "sqlbridge/infra/dispatcher.hpp"

#include "sqlbridge/infra/logger.hpp"

#include <exception>

namespace sqlbridge::infra {

Dispatcher::Dispatcher() : stop_(false), in_flight_(0)
{
    worker_ = std::thread([this] { run(); });
}

Dispatcher::~Dispatcher()
{
    stop();
}

/**
 * @brief Consumer event loop.
 *
 * Exits only once `stop_` is set AND the queue is empty, so every event accepted
 * before shutdown still reaches its handler.
 */
void Dispatcher::run()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (task) {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR,
                            "Dispatcher: Task raised an exception: " + std::string(e.what()));
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --in_flight_;
        }
        idle_.notify_all();
    }
}

bool Dispatcher::post(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        tasks_.emplace(std::move(task));
        ++in_flight_;
    }

    condition_.notify_one();
    return true;
}

void Dispatcher::wait_idle()
{
    if (on_dispatch_thread()) {
        return;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return in_flight_ == 0; });
}

void Dispatcher::stop()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    if (!worker_.joinable()) {
        return;
    }

    if (on_dispatch_thread()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool Dispatcher::on_dispatch_thread() const
{
    return std::this_thread::get_id() == worker_.get_id();
}

} // namespace sqlbridge::infra

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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Producer-consumer pool built on a mutex-protected queue and a condition
 * variable. Shutdown drains pending tasks before joining.
 */

#include "revfs/infra/scheduler.hpp"

#include "revfs/infra/logger.hpp"

#include <exception>
#include <string>

namespace revfs::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

/**
 * @brief Destructor. Orchestrates a graceful pool teardown.
 */
Scheduler::~Scheduler()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Exit only once stopping AND drained, so in-flight requests finish.
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        if (!task) {
            continue;
        }

        // Task exceptions are logged; the worker keeps serving the queue.
        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR,
                        std::string("Scheduler: Task terminated with exception: ") + e.what());
        }
    }
}

/**
 * @brief Dispatches a new task to the worker pool and wakes one worker.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

} // namespace revfs::infra

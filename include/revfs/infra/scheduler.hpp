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
 * @file scheduler.hpp
 * @brief Bounded worker pool for blocking filesystem work.
 *
 * @details
 * Every client connection, and therefore every tree walk, content search,
 * snapshot copy and archive extraction, runs to completion on one of the
 * `Scheduler` workers so that the accept loop is never stalled by slow disk
 * operations.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace revfs::infra {

/**
 * @class Scheduler
 * @brief A thread-safe, fixed-size worker pool with a FIFO task queue.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Faults:** An exception escaping a task is logged and the worker keeps running.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Defaults to the number of logical
     * cores; a value of 0 (undetectable concurrency) is raised to 1.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Graceful shutdown: drains the queue, then joins every worker.
     *
     * @note Blocking. Tasks already queued are still executed.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * @param task Unit of work. Exceptions it throws are logged by the worker.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * Exceptions thrown by `fn` are captured in the future and rethrown by
     * `get()` on the waiting thread.
     *
     * @code
     * auto id = scheduler.submit([&] { return store.snapshot(); });
     * std::uint64_t rev = id.get();
     * @endcode
     */
    template <typename Fn> auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using Result = std::invoke_result_t<Fn>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    /// @brief Number of worker threads in the pool.
    size_t size() const { return workers_.size(); }

  private:
    /// @brief Worker event loop; returns once stopped and drained.
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace revfs::infra

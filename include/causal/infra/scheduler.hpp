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
 * @brief Worker pool that carries the submitter's action context to its workers.
 *
 * @details
 * Execution contexts are per-thread, so work handed to another thread would
 * normally lose track of the action it belongs to. `Scheduler::enqueue` captures
 * the submitting thread's current action and re-establishes it around the task on
 * the worker; actions started by the task therefore become children of the
 * submitter's action, in the same task tree.
 */

#pragma once

#include "causal/core/action.hpp"
#include "causal/core/deferred.hpp"
#include "causal/core/execution_context.hpp"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace causal::infra {

/**
 * @class Scheduler
 * @brief A fixed-size, FIFO worker pool.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `defer()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Context:** Each task runs with the submitter's current action (if any) pushed
 *   on the worker's own execution context, and popped afterwards.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (e.g. when hardware concurrency is
     * unknown) is raised to one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue and joins every worker.
     *
     * @note Blocking: tasks already queued still run.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Queues @p task, bound to the calling thread's current action.
     *
     * An exception escaping @p task is logged at ERROR and does not stop the
     * worker; use `defer` to observe failures.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Runs @p f on a worker and exposes its outcome as a `Deferred`.
     *
     * The deferred resolves with @p f's return value or rejects with the
     * exception it threw. Pair with `Action::finish_after` to finish an action
     * when the background work completes.
     *
     * @code
     * auto action = ActionFactory::start_action(logger, "report:render");
     * auto done = scheduler.defer([] { return render_report(); });
     * action->finish_after(done);
     * @endcode
     */
    template <typename F> auto defer(F f) -> core::Deferred<std::invoke_result_t<F&>>
    {
        using Result = std::invoke_result_t<F&>;
        static_assert(!std::is_void_v<Result>, "Scheduler::defer requires a value-returning task");

        core::Deferred<Result> outcome;
        enqueue([outcome, f = std::move(f)]() mutable {
            std::optional<Result> value;
            try {
                value.emplace(f());
            } catch (...) {
                outcome.reject(std::current_exception());
                return;
            }
            outcome.resolve(std::move(*value));
        });
        return outcome;
    }

    /// Number of worker threads.
    size_t size() const
    {
        return workers_.size();
    }

  private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace causal::infra

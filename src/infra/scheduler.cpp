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
 * @brief Worker pool lifecycle and context-carrying dispatch.
 *
 * @details
 * Producer-consumer over a mutex-guarded FIFO. The action context travels with
 * the task as a `std::shared_ptr<Action>` captured at submission time, so the
 * action outlives the submitting scope if the task is still pending.
 */

#include "causal/infra/scheduler.hpp"

#include "causal/infra/logger.hpp"

namespace causal::infra {

Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    Logger::log(LogLevel::DEBUG, "Scheduler: " + std::to_string(threads) + " workers online.");
}

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

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            // Exit only once stopping AND drained.
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Executed outside the lock.
        try {
            task();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, std::string("Scheduler: task failed: ") + e.what());
        } catch (...) {
            Logger::log(LogLevel::ERROR, "Scheduler: task failed with a non-standard exception.");
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    std::shared_ptr<core::Action> owner = core::ExecutionContext::current();
    if (owner) {
        task = [owner, inner = std::move(task)]() { owner->run(inner); };
    }

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

} // namespace causal::infra

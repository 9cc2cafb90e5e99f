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
 * @file deferred.hpp
 * @brief Single-fire asynchronous outcome with continuation registration.
 *
 * @details
 * `Deferred<T>` is the future-like handle accepted by `Action::finish_after`. It
 * is fired exactly once, with a value or with an exception, and runs every
 * registered continuation with that same outcome:
 * - continuations registered before firing run on the firing thread, in
 *   registration order, after the internal lock is released;
 * - continuations registered after firing run immediately on the registering
 *   thread.
 *
 * Copies share one outcome, so a producer can keep one copy and hand another to
 * consumers. Firing from a worker thread while other threads register is safe.
 *
 * An exception escaping a continuation does not stop the others: every
 * continuation still runs, and the first such exception is then rethrown to
 * whoever fired (or registered, for late registrations).
 */

#pragma once

#include "causal/core/errors.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace causal::core {

template <typename T> class Deferred {
  public:
    Deferred() : state_(std::make_shared<State>()) {}

    /// Fires with a value. @throws UsageError if already fired.
    void resolve(T value)
    {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ensure_unfired();
            state_->value.emplace(std::move(value));
            state_->fired = true;
            pending.swap(state_->continuations);
        }
        state_->fired_cv.notify_all();
        dispatch(pending);
    }

    /// Fires with a failure. @throws UsageError if already fired or @p error is null.
    void reject(std::exception_ptr error)
    {
        if (!error) {
            raise_usage_error("Deferred::reject called with a null exception");
        }
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ensure_unfired();
            state_->error = std::move(error);
            state_->fired = true;
            pending.swap(state_->continuations);
        }
        state_->fired_cv.notify_all();
        dispatch(pending);
    }

    /**
     * @brief Registers separate value and failure continuations.
     *
     * Either may be empty, in which case that outcome is simply not observed.
     */
    void add_callbacks(std::function<void(const T&)> on_value,
                       std::function<void(std::exception_ptr)> on_error)
    {
        std::shared_ptr<State> state = state_;
        enqueue([state, on_value = std::move(on_value), on_error = std::move(on_error)]() {
            if (state->error) {
                if (on_error)
                    on_error(state->error);
            } else if (on_value) {
                on_value(*state->value);
            }
        });
    }

    /**
     * @brief Registers one continuation for both outcomes.
     *
     * It receives `nullptr` on success or the failure.
     */
    void add_both(std::function<void(std::exception_ptr)> on_outcome)
    {
        std::shared_ptr<State> state = state_;
        enqueue([state, on_outcome = std::move(on_outcome)]() { on_outcome(state->error); });
    }

    bool fired() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->fired;
    }

    bool failed() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->fired && state_->error != nullptr;
    }

    /**
     * @brief Blocks until fired; returns the value or rethrows the failure.
     *
     * For program edges (tests, `main`). Library code registers continuations.
     */
    T wait() const
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->fired_cv.wait(lock, [this] { return state_->fired; });
        if (state_->error) {
            std::rethrow_exception(state_->error);
        }
        return *state_->value;
    }

  private:
    struct State {
        std::mutex mutex;
        std::condition_variable fired_cv;
        bool fired = false;
        std::optional<T> value;
        std::exception_ptr error;
        std::vector<std::function<void()>> continuations;
    };

    /// Caller holds the lock.
    void ensure_unfired() const
    {
        if (state_->fired) {
            raise_usage_error("Deferred fired more than once");
        }
    }

    void enqueue(std::function<void()> continuation)
    {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->fired) {
                state_->continuations.push_back(std::move(continuation));
                return;
            }
        }
        continuation();
    }

    /// Runs every continuation, then rethrows the first failure among them.
    static void dispatch(std::vector<std::function<void()>>& pending)
    {
        std::exception_ptr first_failure;
        for (auto& continuation : pending) {
            try {
                continuation();
            } catch (...) {
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
        if (first_failure) {
            std::rethrow_exception(first_failure);
        }
    }

    std::shared_ptr<State> state_;
};

} // namespace causal::core

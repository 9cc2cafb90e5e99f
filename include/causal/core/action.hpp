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
 * @file action.hpp
 * @brief A logical unit of work with a logged beginning and end.
 *
 * @details
 * An `Action` emits exactly one start message when it is created (through
 * `ActionFactory`) and at most one finish message, reporting either success (with
 * the accumulated success fields) or failure (with the exception type and
 * reason). Actions nest: a child shares its parent's `task_uuid` and extends its
 * `task_level` by its 1-based birth order among the parent's children.
 *
 * ## Finishing
 * | Mechanism                   | Context pushed | Finishes |
 * |-----------------------------|----------------|----------|
 * | `finish(error)`             | no             | yes      |
 * | `within(f)`                 | during `f`     | yes, with `f`'s exception if any |
 * | `enter()` -> `ActionScope`  | for the scope  | yes, at scope exit |
 * | `run(f)` / `bind(f)`        | during `f`     | no       |
 * | `context()` -> `ContextScope` | for the scope | no      |
 * | `finish_after(future)`      | no             | when the future fires |
 *
 * ## Threading
 * An action belongs to the thread that created it. The child and message
 * counters and the finished flag are atomic, so children spawned from worker
 * threads get distinct levels and racing completion paths (scope exit versus a
 * deferred continuation) still produce a single finish message. Success fields
 * are not synchronized.
 */

#pragma once

#include "causal/core/errors.hpp"
#include "causal/core/execution_context.hpp"
#include "causal/core/fields.hpp"
#include "causal/core/message_logger.hpp"
#include "causal/core/serializers.hpp"
#include "causal/core/task_level.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace causal::core {

class ActionScope;
class ContextScope;

class Action : public std::enable_shared_from_this<Action> {
  public:
    /// Emits a DEBUG diagnostic if the action never finished.
    ~Action();

    Action(const Action&) = delete;
    Action& operator=(const Action&) = delete;

    // ------------------------------------------------------------------------
    // Identification
    // ------------------------------------------------------------------------

    const std::string& task_uuid() const
    {
        return task_uuid_;
    }

    /// Rendered level path, e.g. `/2/1/`.
    const std::string& task_level() const
    {
        return task_level_;
    }

    const TaskLevel& level() const
    {
        return level_;
    }

    const std::string& action_type() const
    {
        return action_type_;
    }

    /// `{task_uuid, task_level, action_type}` as merged into every action message.
    Fields identification() const;

    const std::shared_ptr<MessageLogger>& logger() const
    {
        return logger_;
    }

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    bool finished() const
    {
        return finished_.load();
    }

    std::uint64_t number_of_children() const
    {
        return number_of_children_.load();
    }

    /**
     * @brief Claims the next message sequence number (0, 1, 2, ...).
     *
     * Called by `Message::write` for every message logged within this action,
     * start and finish messages included.
     */
    std::uint64_t increment_message_counter();

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    /**
     * @brief Adds fields to the eventual success message.
     *
     * Last write per key wins. Ignored once the action has finished.
     */
    void add_success_fields(const Fields& fields);

    /**
     * @brief Logs the finish message. Only the first call has any effect.
     *
     * @param error `nullptr` for success; otherwise the failure that ended the
     * action, reported as `exception`/`reason` fields. Success fields are not
     * included in a failure message.
     *
     * @throws ValidationError if the matching serializer rejects the message. The
     * action is considered finished regardless.
     */
    void finish(std::exception_ptr error = nullptr);

    /**
     * @brief Creates (but does not start) a child action.
     *
     * Prefer `ActionFactory::start_action`, which also logs the start message.
     */
    std::shared_ptr<Action> child(std::shared_ptr<MessageLogger> logger,
                                  const std::string& action_type,
                                  std::shared_ptr<const ActionSerializers> serializers = nullptr);

    /**
     * @brief Invokes @p f with this action as the current action.
     *
     * The context is restored even if @p f throws; the exception propagates and
     * the action does not finish.
     */
    template <typename F> decltype(auto) run(F&& f);

    /**
     * @brief Invokes @p f within this action, then finishes it.
     *
     * On normal return the action succeeds and @p f's result is returned. If @p f
     * throws, the action fails with that exact exception, which is then
     * rethrown.
     *
     * @code
     * auto total = action->within([&] { return charge(cart); });
     * @endcode
     */
    template <typename F> auto within(F&& f);

    /**
     * @brief Wraps @p f so that, whenever and wherever it is invoked, it runs
     * with this action as the current action.
     *
     * The wrapper keeps the action alive. Intended for continuations handed to
     * other threads or event loops.
     */
    template <typename F> auto bind(F f);

    /**
     * @brief Finishes this action when @p future completes.
     *
     * @tparam Future Any type with
     * `add_both(std::function<void(std::exception_ptr)>)` that invokes the
     * continuation exactly once with `nullptr` on success or the failure.
     * `Deferred<T>` satisfies this.
     *
     * The registered continuation holds a reference to this action until it runs.
     * Other continuations on @p future observe its outcome unchanged.
     *
     * @throws UsageError if called a second time on the same action.
     */
    template <typename Future> void finish_after(Future& future);

    /// Pushes this action; the returned guard pops it and finishes the action.
    ActionScope enter();

    /// Pushes this action; the returned guard pops it without finishing.
    ContextScope context();

  private:
    friend class ActionFactory;

    Action(std::shared_ptr<MessageLogger> logger, std::string task_uuid, TaskLevel level,
           std::string action_type, std::shared_ptr<const ActionSerializers> serializers);

    /// Logs the start message. Called once, by `ActionFactory`.
    void start(Fields fields);

    /// Records a `finish_after` registration, rejecting a second one.
    void claim_finish_after();

    std::shared_ptr<MessageLogger> logger_;
    const std::string task_uuid_;
    const TaskLevel level_;
    const std::string task_level_;
    const std::string action_type_;
    const std::shared_ptr<const ActionSerializers> serializers_;

    std::atomic<std::uint64_t> number_of_children_{0};
    std::atomic<std::uint64_t> message_counter_{0};
    std::atomic<bool> finished_{false};
    std::atomic<bool> finish_after_registered_{false};

    Fields success_fields_;
};

/**
 * @class ContextScope
 * @brief RAII guard keeping an action current for the lifetime of the guard.
 */
class ContextScope {
  public:
    explicit ContextScope(std::shared_ptr<Action> action);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;
    ContextScope(ContextScope&&) = delete;
    ContextScope& operator=(ContextScope&&) = delete;

    Action& action() const
    {
        return *action_;
    }

  private:
    std::shared_ptr<Action> action_;
};

/**
 * @class ActionScope
 * @brief RAII guard that keeps an action current and finishes it on exit.
 *
 * @details
 * On exit the action is popped and then finished:
 * - with the failure given to `fail()`, if any;
 * - otherwise, if the scope is being left by stack unwinding, with a
 *   `ScopeUnwound` failure (a destructor cannot see the in-flight exception;
 *   call `fail(std::current_exception())` from a handler, or use
 *   `Action::within`, to report the exact one);
 * - otherwise successfully.
 *
 * A serializer rejecting the finish message propagates out of the destructor
 * on a normal exit. During unwinding it is logged at ERROR instead, since a
 * second exception would terminate the process.
 *
 * @code
 * {
 *     auto scope = ActionFactory::start_action(logger, "cache:refresh")->enter();
 *     try {
 *         scope->add_success_fields(Fields().set("entries", reload()));
 *     } catch (...) {
 *         scope.fail(std::current_exception());
 *         throw;
 *     }
 * } // finish message logged here, with reload()'s exception if it threw
 * @endcode
 *
 * Code that may throw and has no handler of its own should prefer
 * `Action::within`, which records the exact exception without one.
 */
class ActionScope {
  public:
    explicit ActionScope(std::shared_ptr<Action> action);
    ~ActionScope() noexcept(false);

    ActionScope(const ActionScope&) = delete;
    ActionScope& operator=(const ActionScope&) = delete;
    ActionScope(ActionScope&&) = delete;
    ActionScope& operator=(ActionScope&&) = delete;

    Action& action() const
    {
        return *action_;
    }

    Action* operator->() const
    {
        return action_.get();
    }

    /// Records the failure to finish with. The last call wins.
    void fail(std::exception_ptr error);

  private:
    std::shared_ptr<Action> action_;
    std::exception_ptr error_;
    int uncaught_on_entry_;
};

// ============================================================================
//  Template definitions
// ============================================================================

template <typename F> decltype(auto) Action::run(F&& f)
{
    ContextScope scope(shared_from_this());
    return std::forward<F>(f)();
}

template <typename F> auto Action::within(F&& f)
{
    using Result = std::invoke_result_t<F&&>;

    ExecutionContext::push(shared_from_this());

    if constexpr (std::is_void_v<Result>) {
        try {
            std::forward<F>(f)();
        } catch (...) {
            ExecutionContext::pop();
            finish(std::current_exception());
            throw;
        }
        ExecutionContext::pop();
        finish();
    } else {
        Result result = [&]() -> Result {
            try {
                return std::forward<F>(f)();
            } catch (...) {
                ExecutionContext::pop();
                finish(std::current_exception());
                throw;
            }
        }();
        ExecutionContext::pop();
        finish();
        return result;
    }
}

template <typename F> auto Action::bind(F f)
{
    return [self = shared_from_this(), f = std::move(f)](auto&&... args) mutable -> decltype(auto) {
        ContextScope scope(self);
        return f(std::forward<decltype(args)>(args)...);
    };
}

template <typename Future> void Action::finish_after(Future& future)
{
    claim_finish_after();
    std::shared_ptr<Action> self = shared_from_this();
    future.add_both([self](std::exception_ptr error) { self->finish(error); });
}

} // namespace causal::core

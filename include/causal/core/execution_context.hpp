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
 * @file execution_context.hpp
 * @brief Per-thread stack of the actions currently in effect.
 *
 * @details
 * `ActionFactory::start_action` consults the top of this stack to decide whether
 * a new action is a child of the running one or the root of a new task. Each
 * thread owns an independent stack, created lazily on first use and destroyed
 * with the thread; there is no cross-thread visibility and therefore no locking.
 *
 * Pushes and pops must be strictly nested. Prefer the RAII guards returned by
 * `Action::enter()` and `Action::context()` over calling `push`/`pop` directly.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace causal::core {

class Action;

/**
 * @class ExecutionContext
 * @brief Static facade over the calling thread's action stack.
 */
class ExecutionContext {
  public:
    /// Makes @p action the current action of the calling thread.
    static void push(std::shared_ptr<Action> action);

    /**
     * @brief Removes the most recently pushed action.
     *
     * @throws UsageError if the calling thread's stack is empty.
     */
    static void pop();

    /// The most recently pushed action, or `nullptr` if none is in effect.
    static std::shared_ptr<Action> current();

    /// Number of actions on the calling thread's stack.
    static std::size_t depth();

  private:
    static std::vector<std::shared_ptr<Action>>& stack();
};

} // namespace causal::core

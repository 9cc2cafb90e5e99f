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
 * @file execution_context.cpp
 * @brief Thread-local storage behind `ExecutionContext`.
 */

#include "causal/core/execution_context.hpp"

#include "causal/core/action.hpp"
#include "causal/core/errors.hpp"
#include "causal/infra/logger.hpp"

#include <utility>

namespace causal::core {

/**
 * @details
 * Function-local `thread_local` gives each thread its own vector, constructed on
 * the first call from that thread and destroyed at thread exit.
 */
std::vector<std::shared_ptr<Action>>& ExecutionContext::stack()
{
    static thread_local std::vector<std::shared_ptr<Action>> actions;
    return actions;
}

void ExecutionContext::push(std::shared_ptr<Action> action)
{
    if (!action) {
        raise_usage_error("ExecutionContext::push called with a null action");
    }
    if (infra::Logger::enabled(infra::LogLevel::TRACE)) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "Context: push " + action->action_type() + " " + action->task_level());
    }
    stack().push_back(std::move(action));
}

void ExecutionContext::pop()
{
    auto& actions = stack();
    if (actions.empty()) {
        raise_usage_error("ExecutionContext::pop called on an empty stack");
    }
    actions.pop_back();
}

std::shared_ptr<Action> ExecutionContext::current()
{
    auto& actions = stack();
    if (actions.empty()) {
        return nullptr;
    }
    return actions.back();
}

std::size_t ExecutionContext::depth()
{
    return stack().size();
}

} // namespace causal::core

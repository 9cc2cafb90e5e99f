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
 * @file action.cpp
 * @brief Start/finish protocol, child creation and scope guards.
 */

#include "causal/core/action.hpp"

#include "causal/core/message.hpp"
#include "causal/infra/logger.hpp"

namespace causal::core {

Action::Action(std::shared_ptr<MessageLogger> logger, std::string task_uuid, TaskLevel level,
               std::string action_type, std::shared_ptr<const ActionSerializers> serializers)
    : logger_(std::move(logger)),
      task_uuid_(std::move(task_uuid)),
      level_(std::move(level)),
      task_level_(level_.to_string()),
      action_type_(std::move(action_type)),
      serializers_(std::move(serializers))
{
    if (!logger_) {
        raise_usage_error("action '" + action_type_ + "' created without a message logger");
    }
}

/**
 * @details
 * An action dropped before finishing is the latent resource left behind by a
 * continuation that never fired; it is reported but otherwise harmless.
 */
Action::~Action()
{
    if (!finished_.load() && infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Action: " + action_type_ + " " + task_uuid_ +
                                                       " " + task_level_ +
                                                       " released without a finish message.");
    }
}

Fields Action::identification() const
{
    Fields fields;
    fields.set("task_uuid", task_uuid_);
    fields.set("task_level", task_level_);
    fields.set("action_type", action_type_);
    return fields;
}

std::uint64_t Action::increment_message_counter()
{
    return message_counter_.fetch_add(1);
}

void Action::add_success_fields(const Fields& fields)
{
    if (finished_.load()) {
        return;
    }
    success_fields_.merge(fields);
}

/**
 * @details
 * Identification fields are merged last so they cannot be overridden by extra
 * start fields.
 */
void Action::start(Fields fields)
{
    fields.set("action_status", "started");
    fields.merge(identification());

    FieldSerializer serializer = serializers_ ? serializers_->start : FieldSerializer();
    Message(std::move(fields), std::move(serializer)).write(*logger_, this);
}

/**
 * @details
 * The finished flag flips before the message is built: a serializer failure
 * propagates to this caller, and no later completion path gets a second try.
 */
void Action::finish(std::exception_ptr error)
{
    if (finished_.exchange(true)) {
        return;
    }

    Fields fields;
    FieldSerializer serializer;

    if (!error) {
        fields = success_fields_;
        fields.set("action_status", "succeeded");
        if (serializers_) {
            serializer = serializers_->success;
        }
    } else {
        ExceptionDescription description = describe_exception(error);
        fields.set("exception", description.type);
        fields.set("reason", description.reason);
        fields.set("action_status", "failed");
        if (serializers_) {
            serializer = serializers_->failure;
        }
    }

    fields.merge(identification());
    Message(std::move(fields), std::move(serializer)).write(*logger_, this);
}

std::shared_ptr<Action> Action::child(std::shared_ptr<MessageLogger> logger,
                                      const std::string& action_type,
                                      std::shared_ptr<const ActionSerializers> serializers)
{
    std::uint64_t index = number_of_children_.fetch_add(1) + 1;
    return std::shared_ptr<Action>(new Action(std::move(logger), task_uuid_, level_.child(index),
                                              action_type, std::move(serializers)));
}

void Action::claim_finish_after()
{
    if (finish_after_registered_.exchange(true)) {
        raise_usage_error("finish_after registered twice on " + action_type_ + " " + task_level_);
    }
    if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Action: " + action_type_ + " " + task_level_ +
                                                       " will finish on deferred completion.");
    }
}

ActionScope Action::enter()
{
    return ActionScope(shared_from_this());
}

ContextScope Action::context()
{
    return ContextScope(shared_from_this());
}

// ============================================================================
//  ContextScope
// ============================================================================

ContextScope::ContextScope(std::shared_ptr<Action> action) : action_(std::move(action))
{
    ExecutionContext::push(action_);
}

ContextScope::~ContextScope()
{
    ExecutionContext::pop();
}

// ============================================================================
//  ActionScope
// ============================================================================

ActionScope::ActionScope(std::shared_ptr<Action> action)
    : action_(std::move(action)), uncaught_on_entry_(std::uncaught_exceptions())
{
    ExecutionContext::push(action_);
}

void ActionScope::fail(std::exception_ptr error)
{
    error_ = std::move(error);
}

ActionScope::~ActionScope() noexcept(false)
{
    ExecutionContext::pop();

    const bool unwinding = std::uncaught_exceptions() > uncaught_on_entry_;
    std::exception_ptr error = error_;
    if (!error && unwinding) {
        error = std::make_exception_ptr(ScopeUnwound());
    }

    if (!unwinding) {
        action_->finish(error);
        return;
    }

    try {
        action_->finish(error);
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR, "Action: finish of " + action_->action_type() +
                                                       " " + action_->task_level() +
                                                       " failed during unwinding: " + e.what());
    }
}

} // namespace causal::core

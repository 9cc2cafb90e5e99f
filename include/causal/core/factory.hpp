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
 * @file factory.hpp
 * @brief The sanctioned entry points for creating actions.
 *
 * @details
 * Actions are never constructed directly: the factory assigns the task
 * identifier and level, then logs the start message before handing the action
 * back. What happens next (scoping, explicit `finish`, `finish_after`) is up to
 * the caller.
 */

#pragma once

#include "causal/core/action.hpp"
#include "causal/core/fields.hpp"
#include "causal/core/message_logger.hpp"
#include "causal/core/serializers.hpp"

#include <memory>
#include <string>

namespace causal::core {

class ActionFactory {
  public:
    /**
     * @brief Starts an action under the calling thread's current action.
     *
     * With no current action this is exactly `start_task`. Otherwise the new
     * action is the next child of the current one.
     *
     * @param logger Destination for this action's messages.
     * @param action_type Free-form kind of work, e.g. `"billing:charge"`.
     * @param fields Extra fields for the start message.
     * @param serializers Optional validators/transformers for this action type.
     *
     * @throws ValidationError if the start serializer rejects the message.
     *
     * @code
     * auto action = ActionFactory::start_action(logger, "billing:charge",
     *                                           Fields().set("amount", 1250));
     * action->within([&] { gateway.charge(1250); });
     * @endcode
     */
    static std::shared_ptr<Action>
    start_action(std::shared_ptr<MessageLogger> logger, const std::string& action_type,
                 Fields fields = Fields(),
                 std::shared_ptr<const ActionSerializers> serializers = nullptr);

    /**
     * @brief Starts an action under an explicitly supplied parent.
     *
     * For call chains that pass the active action along instead of relying on the
     * thread's context. A null @p parent starts a new task.
     */
    static std::shared_ptr<Action>
    start_action(const std::shared_ptr<Action>& parent, std::shared_ptr<MessageLogger> logger,
                 const std::string& action_type, Fields fields = Fields(),
                 std::shared_ptr<const ActionSerializers> serializers = nullptr);

    /**
     * @brief Starts a new task: a root action with a fresh `task_uuid` and level `/`.
     */
    static std::shared_ptr<Action>
    start_task(std::shared_ptr<MessageLogger> logger, const std::string& action_type,
               Fields fields = Fields(),
               std::shared_ptr<const ActionSerializers> serializers = nullptr);
};

} // namespace causal::core

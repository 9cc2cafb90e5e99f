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

#include "causal/core/factory.hpp"

#include "causal/core/execution_context.hpp"
#include "causal/infra/id_generator.hpp"

#include <utility>

namespace causal::core {

std::shared_ptr<Action> ActionFactory::start_action(std::shared_ptr<MessageLogger> logger,
                                                    const std::string& action_type, Fields fields,
                                                    std::shared_ptr<const ActionSerializers> serializers)
{
    return start_action(ExecutionContext::current(), std::move(logger), action_type,
                        std::move(fields), std::move(serializers));
}

std::shared_ptr<Action> ActionFactory::start_action(const std::shared_ptr<Action>& parent,
                                                    std::shared_ptr<MessageLogger> logger,
                                                    const std::string& action_type, Fields fields,
                                                    std::shared_ptr<const ActionSerializers> serializers)
{
    if (!parent) {
        return start_task(std::move(logger), action_type, std::move(fields),
                          std::move(serializers));
    }

    std::shared_ptr<Action> action = parent->child(std::move(logger), action_type,
                                                   std::move(serializers));
    action->start(std::move(fields));
    return action;
}

std::shared_ptr<Action> ActionFactory::start_task(std::shared_ptr<MessageLogger> logger,
                                                  const std::string& action_type, Fields fields,
                                                  std::shared_ptr<const ActionSerializers> serializers)
{
    std::shared_ptr<Action> action(new Action(std::move(logger), infra::IdGenerator::task_uuid(),
                                              TaskLevel(), action_type, std::move(serializers)));
    action->start(std::move(fields));
    return action;
}

} // namespace causal::core

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
 * @file message.cpp
 * @brief Stamping and delivery of log entries.
 */

#include "causal/core/message.hpp"

#include "causal/core/action.hpp"
#include "causal/core/execution_context.hpp"
#include "causal/infra/id_generator.hpp"

#include <chrono>
#include <memory>
#include <utility>

namespace causal::core {

namespace {

double unix_seconds()
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

} // namespace

Message::Message(Fields fields, FieldSerializer serializer)
    : fields_(std::move(fields)), serializer_(std::move(serializer))
{
}

/**
 * @details
 * The counter is taken before the serializer runs, so a rejected message still
 * consumes its slot; consumers see a gap rather than a reused number.
 */
void Message::write(MessageLogger& logger, Action* action) const
{
    // Keeps the implicit owner alive for the duration of the write.
    std::shared_ptr<Action> implicit;
    if (action == nullptr) {
        implicit = ExecutionContext::current();
        action = implicit.get();
    }

    Fields contents(fields_);

    if (action != nullptr) {
        contents.set("task_uuid", action->task_uuid());
        contents.set("task_level", action->task_level());
        contents.set("action_counter", action->increment_message_counter());
    } else {
        contents.set("task_uuid", infra::IdGenerator::task_uuid());
        contents.set("task_level", "/");
        contents.set("action_counter", 0);
    }
    contents.set("timestamp", unix_seconds());

    Fields delivered = Serializers::apply(serializer_, std::move(contents));
    logger.write(delivered, action);
}

void Message::log(MessageLogger& logger, Fields fields)
{
    Message(std::move(fields)).write(logger);
}

} // namespace causal::core

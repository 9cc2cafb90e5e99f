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
 * @file message.hpp
 * @brief A single log entry on its way to a `MessageLogger`.
 *
 * @details
 * `Message` stamps the fields that place an entry in its task tree and in time,
 * runs the serializer, and hands the result to the destination:
 *
 * | Field            | Source                                                   |
 * |------------------|----------------------------------------------------------|
 * | `task_uuid`      | owning action, or a fresh identifier for a lone message  |
 * | `task_level`     | owning action, or `/` for a lone message                 |
 * | `action_counter` | `Action::increment_message_counter()`, or 0               |
 * | `timestamp`      | wall clock, seconds since the Unix epoch                 |
 */

#pragma once

#include "causal/core/fields.hpp"
#include "causal/core/message_logger.hpp"
#include "causal/core/serializers.hpp"

namespace causal::core {

class Action;

class Message {
  public:
    explicit Message(Fields fields, FieldSerializer serializer = nullptr);

    /**
     * @brief Completes the entry and delivers it.
     *
     * @param logger Destination.
     * @param action Owning action. When null, the calling thread's current action
     * is used; when there is none either, the message stands alone.
     *
     * @throws ValidationError if the serializer rejects the fields.
     */
    void write(MessageLogger& logger, Action* action = nullptr) const;

    /**
     * @brief Logs @p fields within the calling thread's current action.
     *
     * @code
     * Message::log(*logger, Fields().set("message_type", "cache:miss").set("key", key));
     * @endcode
     */
    static void log(MessageLogger& logger, Fields fields);

    const Fields& fields() const
    {
        return fields_;
    }

  private:
    Fields fields_;
    FieldSerializer serializer_;
};

} // namespace causal::core

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
 * @file message_logger.hpp
 * @brief Destinations for finished action messages.
 *
 * @details
 * The core never formats or transports messages itself. It hands each completed
 * field mapping to a `MessageLogger`, together with the action that produced it.
 * Two implementations ship with the library:
 * - `MemoryLogger`: retains messages in memory for inspection (tests, tooling).
 * - `JsonLinesLogger`: writes one compact JSON document per line to a stream.
 */

#pragma once

#include "causal/core/fields.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace causal::core {

class Action;

/**
 * @class MessageLogger
 * @brief Abstract sink accepting fully formed messages.
 *
 * @details
 * Implementations are responsible for delivery guarantees. `write` is called
 * synchronously on the thread that emitted the message and must not call back
 * into the originating action.
 */
class MessageLogger {
  public:
    virtual ~MessageLogger() = default;

    /**
     * @param message The complete field mapping.
     * @param origin The action the message was logged within, or `nullptr` for a
     * message logged outside any action.
     */
    virtual void write(const Fields& message, const Action* origin) = 0;
};

/**
 * @class MemoryLogger
 * @brief Thread-safe in-memory message collector.
 */
class MemoryLogger : public MessageLogger {
  public:
    void write(const Fields& message, const Action* origin) override;

    /// Snapshot of every message received so far, in arrival order.
    std::vector<Fields> messages() const;

    /// Messages whose `task_uuid` equals @p task_uuid, in arrival order.
    std::vector<Fields> messages_for(const std::string& task_uuid) const;

    std::size_t size() const;

    void reset();

  private:
    mutable std::mutex mutex_;
    std::vector<Fields> messages_;
};

/**
 * @class JsonLinesLogger
 * @brief Serializes each message as a single JSON line.
 *
 * @details
 * The stream is borrowed and must outlive the logger. Every line is flushed so a
 * crashing process still leaves complete records behind.
 */
class JsonLinesLogger : public MessageLogger {
  public:
    explicit JsonLinesLogger(std::ostream& out);

    void write(const Fields& message, const Action* origin) override;

    /// Number of lines written so far.
    std::size_t written() const;

  private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    std::size_t written_ = 0;
};

} // namespace causal::core

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
 * @file message_logger.cpp
 * @brief Bundled message destinations.
 */

#include "causal/core/message_logger.hpp"

#include "causal/infra/logger.hpp"

#include <stdexcept>

namespace causal::core {

// ============================================================================
//  MemoryLogger
// ============================================================================

void MemoryLogger::write(const Fields& message, const Action* /*origin*/)
{
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
}

std::vector<Fields> MemoryLogger::messages() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<Fields> MemoryLogger::messages_for(const std::string& task_uuid) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Fields> matching;
    for (const auto& message : messages_) {
        if (message.get_string("task_uuid") == task_uuid) {
            matching.push_back(message);
        }
    }
    return matching;
}

std::size_t MemoryLogger::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

void MemoryLogger::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
}

// ============================================================================
//  JsonLinesLogger
// ============================================================================

JsonLinesLogger::JsonLinesLogger(std::ostream& out) : out_(out) {}

/**
 * @details
 * Encoding happens before the lock is taken; only the stream write is
 * serialized. A failed stream is reported as `std::runtime_error` so the caller
 * learns that the record was lost.
 */
void JsonLinesLogger::write(const Fields& message, const Action* /*origin*/)
{
    std::string line = message.to_json();

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();

    if (!out_.good()) {
        infra::Logger::log(infra::LogLevel::ERROR, "Output: JSON lines stream rejected a record.");
        throw std::runtime_error("JSON lines destination is not writable");
    }
    ++written_;
}

std::size_t JsonLinesLogger::written() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

} // namespace causal::core

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
 * @file errors.cpp
 * @brief Failure description and usage-error reporting.
 */

#include "causal/core/errors.hpp"

#include "causal/infra/logger.hpp"
#include "causal/infra/string.hpp"

#include <typeinfo>

namespace causal::core {

namespace {

constexpr const char* kUnprintable = "<unprintable exception>";

} // namespace

/**
 * @details
 * The exception is rethrown locally and classified by the handler that catches
 * it. Any failure while building the strings (allocation included) degrades to
 * the fixed placeholder so the logging path cannot itself fail.
 */
ExceptionDescription describe_exception(const std::exception_ptr& error) noexcept
{
    ExceptionDescription description;
    try {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            description.type = infra::String::demangle(typeid(e).name());
            description.reason = infra::String::to_safe_utf8(e.what());
        } catch (const std::string& s) {
            description.type = "std::string";
            description.reason = infra::String::to_safe_utf8(s);
        } catch (const char* s) {
            description.type = "const char*";
            description.reason = s ? infra::String::to_safe_utf8(s) : kUnprintable;
        } catch (...) {
            description.type = "unknown";
            description.reason = kUnprintable;
        }
    } catch (...) {
        // Building the strings failed; fall back to what needs no allocation
        // beyond two short literals.
        try {
            description.type = "unknown";
            description.reason = kUnprintable;
        } catch (...) {
            description = ExceptionDescription{};
        }
    }
    return description;
}

void raise_usage_error(const std::string& message)
{
    infra::Logger::log(infra::LogLevel::FATAL, "Usage: " + message);
    throw UsageError(message);
}

} // namespace causal::core

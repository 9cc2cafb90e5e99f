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
 * @file errors.hpp
 * @brief Error taxonomy of the action-tracking core.
 *
 * @details
 * - `UsageError`: the caller broke a contract (unbalanced context pops, repeated
 *   deferred registration). These are programming errors and are logged at FATAL
 *   before being thrown.
 * - `ValidationError`: a serializer or parser rejected a field mapping. Always
 *   propagated to the caller of `start`/`finish`/`parse`.
 * - `ScopeUnwound`: the failure recorded when an `ActionScope` is destroyed by
 *   stack unwinding without having been told which exception caused it.
 *
 * Business failures handed to `Action::finish` are not errors of this library;
 * `describe_exception` turns them into message fields.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace causal::core {

class UsageError : public std::logic_error {
  public:
    explicit UsageError(const std::string& what) : std::logic_error(what) {}
};

class ValidationError : public std::runtime_error {
  public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

class ScopeUnwound : public std::runtime_error {
  public:
    ScopeUnwound() : std::runtime_error("action scope exited by exception") {}
};

/// @brief The `exception`/`reason` pair written into a failed finish message.
struct ExceptionDescription {
    std::string type;
    std::string reason;
};

/**
 * @brief Describes the exception held by @p error.
 *
 * - `std::exception` subclasses: demangled dynamic type and `what()`.
 * - Thrown `std::string` / `const char*`: type `std::string` / `const char*`.
 * - Anything else: type `unknown`, reason `<unprintable exception>`.
 *
 * The reason is always valid UTF-8. Never throws.
 *
 * @pre @p error is not null.
 */
ExceptionDescription describe_exception(const std::exception_ptr& error) noexcept;

/**
 * @brief Logs @p message at FATAL and throws `UsageError` carrying it.
 */
[[noreturn]] void raise_usage_error(const std::string& message);

} // namespace causal::core

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
 * @file logger.hpp
 * @brief Diagnostic logging facility for the causal library itself.
 *
 * @details
 * This header declares the `Logger` class used by the library to report its own
 * condition (usage errors, abandoned actions, scope teardown failures). It is NOT
 * the destination of action messages: those flow through `core::MessageLogger`.
 * Output is serialized across threads so diagnostic lines never interleave.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace causal::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-message detail (context pushes, counter increments).
    DEBUG, ///< Lifecycle detail (abandoned actions, deferred registrations).
    INFO,  ///< Nominal events (demo start, worker pool sizing).
    WARN,  ///< Anomalies that do not affect emitted messages.
    ERROR, ///< A finish message could not be produced.
    FATAL  ///< Usage errors: the caller broke the push/pop or registration contract.
};

/**
 * @class Logger
 * @brief A static utility class providing library-wide diagnostics.
 *
 * @details
 * Entries below the configured threshold are discarded before any formatting
 * takes place. The threshold defaults to `INFO` and may be set programmatically
 * or from the `CAUSAL_LOG_LEVEL` environment variable.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * causal::infra::Logger::log(LogLevel::DEBUG, "Action: scope left without finish.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console.
    static void set_level(LogLevel level);

    /// @brief Returns the active threshold.
    static LogLevel level();

    /// @brief Reports whether an entry of @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Maps a case-insensitive level name ("trace" ... "fatal") to a LogLevel.
     *
     * @return std::nullopt for unrecognized names.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

    /**
     * @brief Applies `CAUSAL_LOG_LEVEL` from the environment if it is set.
     *
     * An unrecognized value leaves the threshold untouched and is reported at WARN.
     *
     * @return true if the threshold was changed.
     */
    static bool configure_from_env();

  private:
    /// @brief Guards `std::cout`/`std::cerr` and the threshold.
    static std::mutex mutex_;

    static LogLevel threshold_;
};

} // namespace causal::infra

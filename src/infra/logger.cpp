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
 * @file logger.cpp
 * @brief Implementation of the diagnostic logging utility.
 *
 * @details
 * Formats timestamped, severity-tagged and ANSI color-coded lines. The threshold
 * check and the write happen under one lock so a concurrent `set_level` never
 * observes a half-written entry.
 */

#include "causal/infra/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace causal::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::INFO;

void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(LogLevel level)
{
    return level >= Logger::level();
}

std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * @brief Reads the `CAUSAL_LOG_LEVEL` override.
 *
 * Called once by executables during bootstrap; the library never reads the
 * environment on its own.
 */
bool Logger::configure_from_env()
{
    const char* raw = std::getenv("CAUSAL_LOG_LEVEL");
    if (raw == nullptr || *raw == '\0') {
        return false;
    }

    auto parsed = parse_level(raw);
    if (!parsed) {
        log(LogLevel::WARN,
            "Config: Ignoring unrecognized CAUSAL_LOG_LEVEL '" + std::string(raw) + "'");
        return false;
    }

    set_level(*parsed);
    return true;
}

} // namespace causal::infra

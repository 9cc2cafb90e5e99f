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
 * @file id_generator.hpp
 * @brief Task identifier generation.
 *
 * @details
 * Every root action (task) receives a fresh `task_uuid` that is then shared by all
 * of its descendants. The identifier is a 128-bit random value rendered as a
 * Version 4 UUID so log consumers can correlate messages across files and hosts.
 */

#pragma once

#include <string>

namespace causal::infra {

/**
 * @class IdGenerator
 * @brief A static utility for producing and checking task identifiers.
 *
 * @details
 * Randomness comes from per-thread engines, so concurrent task creation on
 * different threads never contends on a lock.
 */
class IdGenerator {
  public:
    /**
     * @brief Generates a new task identifier.
     *
     * Canonical layout `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` where `y` is one of
     * `{8, 9, a, b}`.
     *
     * @code
     * std::string task = causal::infra::IdGenerator::task_uuid();
     * @endcode
     */
    static std::string task_uuid();

    /**
     * @brief Checks that @p id has the layout produced by `task_uuid()`.
     *
     * Lowercase hexadecimal only; version and variant nibbles are enforced.
     */
    static bool is_task_uuid(const std::string& id);
};

} // namespace causal::infra

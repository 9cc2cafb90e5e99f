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
 * @file task_level.hpp
 * @brief Position of an action inside its task tree.
 *
 * @details
 * A level is the sequence of 1-based child indexes leading from the root action
 * to the action in question. It is rendered as a slash-delimited path: the root is
 * `/`, its second child is `/2/`, and that child's first child is `/2/1/`.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace causal::core {

class TaskLevel {
  public:
    /// The root level, `/`.
    TaskLevel() = default;

    /**
     * @brief Parses a rendered path.
     *
     * @throws ValidationError unless @p text is `/` or a sequence of positive
     * decimal segments each terminated by `/` (leading zeros rejected).
     */
    static TaskLevel parse(const std::string& text);

    /**
     * @brief Returns this level extended by one segment.
     *
     * @param index The 1-based position among its siblings.
     * @throws UsageError if @p index is 0.
     */
    TaskLevel child(std::uint64_t index) const;

    /// The enclosing level; the root is its own parent.
    TaskLevel parent() const;

    bool is_root() const
    {
        return segments_.empty();
    }

    std::size_t depth() const
    {
        return segments_.size();
    }

    const std::vector<std::uint64_t>& segments() const
    {
        return segments_;
    }

    std::string to_string() const;

    bool operator==(const TaskLevel& other) const
    {
        return segments_ == other.segments_;
    }

    bool operator!=(const TaskLevel& other) const
    {
        return !(*this == other);
    }

  private:
    explicit TaskLevel(std::vector<std::uint64_t> segments) : segments_(std::move(segments)) {}

    std::vector<std::uint64_t> segments_;
};

} // namespace causal::core

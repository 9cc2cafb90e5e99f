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

#include "causal/core/task_level.hpp"

#include "causal/core/errors.hpp"

#include <limits>

namespace causal::core {

TaskLevel TaskLevel::parse(const std::string& text)
{
    if (text.empty() || text.front() != '/' || text.back() != '/') {
        throw ValidationError("task level must start and end with '/': '" + text + "'");
    }

    std::vector<std::uint64_t> segments;
    std::uint64_t value = 0;
    std::size_t digits = 0;

    for (std::size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == '/') {
            if (digits == 0 || value == 0) {
                throw ValidationError("task level has an empty or zero segment: '" + text + "'");
            }
            segments.push_back(value);
            value = 0;
            digits = 0;
            continue;
        }

        if (c < '0' || c > '9') {
            throw ValidationError("task level has a non-digit character: '" + text + "'");
        }
        if (digits == 0 && c == '0') {
            throw ValidationError("task level segment has a leading zero: '" + text + "'");
        }

        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            throw ValidationError("task level segment overflows: '" + text + "'");
        }
        value = value * 10 + digit;
        ++digits;
    }

    return TaskLevel(std::move(segments));
}

TaskLevel TaskLevel::child(std::uint64_t index) const
{
    if (index == 0) {
        raise_usage_error("task level segments are 1-based; got 0");
    }
    std::vector<std::uint64_t> extended(segments_);
    extended.push_back(index);
    return TaskLevel(std::move(extended));
}

TaskLevel TaskLevel::parent() const
{
    if (segments_.empty()) {
        return *this;
    }
    return TaskLevel(std::vector<std::uint64_t>(segments_.begin(), segments_.end() - 1));
}

std::string TaskLevel::to_string() const
{
    std::string out = "/";
    for (std::uint64_t segment : segments_) {
        out += std::to_string(segment);
        out += '/';
    }
    return out;
}

} // namespace causal::core

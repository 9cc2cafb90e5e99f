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

#include "causal/core/serializers.hpp"

#include "causal/core/errors.hpp"

#include <utility>

namespace causal::core {

FieldSerializer Serializers::require_fields(std::vector<std::string> names)
{
    return [names = std::move(names)](Fields fields) {
        for (const auto& name : names) {
            if (!fields.contains(name)) {
                throw ValidationError("missing required field '" + name + "'");
            }
        }
        return fields;
    };
}

FieldSerializer Serializers::chain(FieldSerializer first, FieldSerializer second)
{
    if (!first) {
        return second;
    }
    if (!second) {
        return first;
    }
    return [first = std::move(first), second = std::move(second)](Fields fields) {
        return second(first(std::move(fields)));
    };
}

Fields Serializers::apply(const FieldSerializer& serializer, Fields fields)
{
    if (!serializer) {
        return fields;
    }
    return serializer(std::move(fields));
}

} // namespace causal::core

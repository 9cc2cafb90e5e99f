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
 * @file serializers.hpp
 * @brief Per-action-type validation and transformation of message fields.
 *
 * @details
 * An action type may carry three serializers, one per message it emits: the
 * start message, the success finish message and the failure finish message. Each
 * receives the raw mapping and returns the mapping to deliver, or throws
 * `ValidationError`. The core applies whichever one matches and lets any failure
 * propagate to the caller.
 */

#pragma once

#include "causal/core/fields.hpp"

#include <functional>
#include <string>
#include <vector>

namespace causal::core {

/// Transforms or validates a mapping. An empty function leaves the mapping as is.
using FieldSerializer = std::function<Fields(Fields)>;

/**
 * @struct ActionSerializers
 * @brief The serializer triple attached to an action type.
 *
 * Shared between every action of the type via `std::shared_ptr<const ActionSerializers>`.
 */
struct ActionSerializers {
    FieldSerializer start;
    FieldSerializer success;
    FieldSerializer failure;
};

/**
 * @class Serializers
 * @brief Builders for common serializers.
 */
class Serializers {
  public:
    /**
     * @brief A validator rejecting mappings that lack any of @p names.
     *
     * The thrown `ValidationError` names the first missing key.
     *
     * @code
     * ActionSerializers checkout;
     * checkout.start = Serializers::require_fields({"cart_id"});
     * checkout.success = Serializers::require_fields({"order_id"});
     * @endcode
     */
    static FieldSerializer require_fields(std::vector<std::string> names);

    /// Applies @p first, then @p second. Either may be empty.
    static FieldSerializer chain(FieldSerializer first, FieldSerializer second);

    /// Runs @p serializer on @p fields if it is set.
    static Fields apply(const FieldSerializer& serializer, Fields fields);
};

} // namespace causal::core

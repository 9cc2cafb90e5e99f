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
 * @file causal.hpp
 * @brief Convenience header pulling in the public causal API.
 */

#pragma once

#include "causal/core/action.hpp"
#include "causal/core/deferred.hpp"
#include "causal/core/errors.hpp"
#include "causal/core/execution_context.hpp"
#include "causal/core/factory.hpp"
#include "causal/core/fields.hpp"
#include "causal/core/message.hpp"
#include "causal/core/message_logger.hpp"
#include "causal/core/serializers.hpp"
#include "causal/core/task_level.hpp"
#include "causal/infra/id_generator.hpp"
#include "causal/infra/logger.hpp"
#include "causal/infra/scheduler.hpp"

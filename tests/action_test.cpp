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
 * @file action_test.cpp
 * @brief Unit tests for the action lifecycle and `ActionFactory`.
 *
 * @details
 * Scenarios verified:
 * - Start/finish message contents and the single-finish guarantee.
 * - Task level assignment for nested and sibling actions.
 * - Message counters within one action.
 * - Serializer validation on start and finish.
 */

#include "causal/core/errors.hpp"
#include "causal/core/factory.hpp"
#include "causal/core/message.hpp"
#include "causal/core/message_logger.hpp"
#include "causal/infra/id_generator.hpp"
#include "framework.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using causal::core::ActionFactory;
using causal::core::ActionSerializers;
using causal::core::Fields;
using causal::core::MemoryLogger;

namespace {

std::string status_of(const Fields& message)
{
    return message.get_string("action_status").value_or("");
}

} // namespace

void test_task_start_message()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto task = ActionFactory::start_task(logger, "http:request", Fields().set("path", "/cart"));

    ASSERT_TRUE(causal::infra::IdGenerator::is_task_uuid(task->task_uuid()));
    ASSERT_EQ(task->task_level(), std::string("/"));

    auto messages = logger->messages();
    ASSERT_EQ(messages.size(), static_cast<size_t>(1));
    ASSERT_EQ(status_of(messages[0]), std::string("started"));
    ASSERT_EQ(*messages[0].get_string("action_type"), std::string("http:request"));
    ASSERT_EQ(*messages[0].get_string("path"), std::string("/cart"));
    ASSERT_EQ(*messages[0].get_number("action_counter"), 0.0);

    task->finish();
}

/**
 * @brief Identification cannot be overridden by caller-supplied start fields.
 */
void test_start_fields_cannot_spoof_identity()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto task = ActionFactory::start_task(
        logger, "auth:login", Fields().set("task_level", "/9/").set("action_type", "other"));

    Fields started = logger->messages().front();
    ASSERT_EQ(*started.get_string("task_level"), std::string("/"));
    ASSERT_EQ(*started.get_string("action_type"), std::string("auth:login"));
    task->finish();
}

void test_nested_levels()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto root = ActionFactory::start_task(logger, "job:root");

    auto first = ActionFactory::start_action(root, logger, "job:step");
    auto grandchild = ActionFactory::start_action(first, logger, "job:substep");
    auto second = ActionFactory::start_action(root, logger, "job:step");

    ASSERT_EQ(first->task_level(), std::string("/1/"));
    ASSERT_EQ(grandchild->task_level(), std::string("/1/1/"));
    ASSERT_EQ(second->task_level(), std::string("/2/"));
    ASSERT_EQ(grandchild->task_uuid(), root->task_uuid());
    ASSERT_EQ(root->number_of_children(), static_cast<std::uint64_t>(2));

    grandchild->finish();
    first->finish();
    second->finish();
    root->finish();

    ASSERT_EQ(logger->messages_for(root->task_uuid()).size(), static_cast<size_t>(8));
}

/**
 * @brief Without a parent or current action, `start_action` begins a new task.
 */
void test_start_action_without_parent_is_task()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto a = ActionFactory::start_action(logger, "job:a");
    auto b = ActionFactory::start_action(nullptr, logger, "job:b");

    ASSERT_EQ(a->task_level(), std::string("/"));
    ASSERT_EQ(b->task_level(), std::string("/"));
    ASSERT_NE(a->task_uuid(), b->task_uuid());

    a->finish();
    b->finish();
}

void test_success_fields()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto action = ActionFactory::start_task(logger, "db:query");

    action->add_success_fields(Fields().set("rows", 3).set("cached", false));
    action->add_success_fields(Fields().set("rows", 4));
    action->finish();
    action->add_success_fields(Fields().set("late", true));

    Fields finished = logger->messages().back();
    ASSERT_EQ(status_of(finished), std::string("succeeded"));
    ASSERT_EQ(*finished.get_number("rows"), 4.0);
    ASSERT_FALSE(*finished.get_bool("cached"));
    ASSERT_FALSE(finished.contains("late"));
    ASSERT_EQ(*finished.get_number("action_counter"), 1.0);
}

void test_failure_fields()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto action = ActionFactory::start_task(logger, "db:query");
    action->add_success_fields(Fields().set("rows", 3));

    action->finish(std::make_exception_ptr(std::invalid_argument("bad table")));

    Fields finished = logger->messages().back();
    ASSERT_EQ(status_of(finished), std::string("failed"));
    ASSERT_EQ(*finished.get_string("exception"), std::string("std::invalid_argument"));
    ASSERT_EQ(*finished.get_string("reason"), std::string("bad table"));
    ASSERT_FALSE(finished.contains("rows"));
}

void test_finish_is_idempotent()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto action = ActionFactory::start_task(logger, "job:once");

    action->finish();
    action->finish(std::make_exception_ptr(std::runtime_error("late")));
    action->finish();

    ASSERT_TRUE(action->finished());
    ASSERT_EQ(logger->size(), static_cast<size_t>(2));
    ASSERT_EQ(status_of(logger->messages().back()), std::string("succeeded"));
}

/**
 * @brief Messages logged within an action take consecutive counter values.
 */
void test_message_counter_sequence()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto action = ActionFactory::start_task(logger, "job:chatty");

    {
        auto scope = action->context();
        causal::core::Message::log(*logger, Fields().set("message_type", "note"));
        causal::core::Message::log(*logger, Fields().set("message_type", "note"));
    }
    action->finish();

    auto messages = logger->messages();
    ASSERT_EQ(messages.size(), static_cast<size_t>(4));
    for (size_t i = 0; i < messages.size(); ++i) {
        ASSERT_EQ(*messages[i].get_number("action_counter"), static_cast<double>(i));
        ASSERT_EQ(*messages[i].get_string("task_level"), std::string("/"));
    }
}

void test_success_serializer_rejects()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto serializers = std::make_shared<ActionSerializers>();
    serializers->success = causal::core::Serializers::require_fields({"total"});

    auto action = ActionFactory::start_task(logger, "cart:checkout", Fields(), serializers);
    ASSERT_THROWS(causal::core::ValidationError, action->finish());

    // Finished even though no message could be produced.
    ASSERT_TRUE(action->finished());
    ASSERT_EQ(logger->size(), static_cast<size_t>(1));

    auto accepted = ActionFactory::start_task(logger, "cart:checkout", Fields(), serializers);
    accepted->add_success_fields(Fields().set("total", 42));
    accepted->finish();
    ASSERT_EQ(*logger->messages().back().get_number("total"), 42.0);
}

/**
 * @brief The failure serializer shapes failure messages and leaves success ones alone.
 */
void test_failure_serializer_applies()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto serializers = std::make_shared<ActionSerializers>();
    serializers->failure = [](Fields fields) {
        fields.set("severity", "page");
        return fields;
    };

    auto failing = ActionFactory::start_task(logger, "payment:capture", Fields(), serializers);
    failing->finish(std::make_exception_ptr(std::runtime_error("card declined")));

    Fields failed = logger->messages().back();
    ASSERT_EQ(status_of(failed), std::string("failed"));
    ASSERT_EQ(*failed.get_string("severity"), std::string("page"));
    ASSERT_EQ(*failed.get_string("reason"), std::string("card declined"));

    auto passing = ActionFactory::start_task(logger, "payment:capture", Fields(), serializers);
    passing->finish();
    ASSERT_FALSE(logger->messages().back().contains("severity"));
}

void test_start_serializer_rejects()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto serializers = std::make_shared<ActionSerializers>();
    serializers->start = causal::core::Serializers::require_fields({"user"});

    ASSERT_THROWS(causal::core::ValidationError,
                  ActionFactory::start_task(logger, "auth:login", Fields(), serializers));
    ASSERT_EQ(logger->size(), static_cast<size_t>(0));
}

void test_action_requires_logger()
{
    ASSERT_THROWS(causal::core::UsageError, ActionFactory::start_task(nullptr, "job:orphan"));
}

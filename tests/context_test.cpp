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
 * @file context_test.cpp
 * @brief Unit tests for the per-thread execution context.
 */

#include "causal/core/errors.hpp"
#include "causal/core/execution_context.hpp"
#include "causal/core/factory.hpp"
#include "causal/core/message_logger.hpp"
#include "framework.hpp"

#include <memory>
#include <string>
#include <thread>

using causal::core::ActionFactory;
using causal::core::ExecutionContext;
using causal::core::MemoryLogger;

void test_context_push_pop()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto outer = ActionFactory::start_task(logger, "ctx:outer");
    auto inner = ActionFactory::start_task(logger, "ctx:inner");

    ASSERT_TRUE(ExecutionContext::current() == nullptr);

    ExecutionContext::push(outer);
    ExecutionContext::push(inner);
    ASSERT_EQ(ExecutionContext::depth(), static_cast<size_t>(2));
    ASSERT_TRUE(ExecutionContext::current() == inner);

    ExecutionContext::pop();
    ASSERT_TRUE(ExecutionContext::current() == outer);
    ExecutionContext::pop();
    ASSERT_TRUE(ExecutionContext::current() == nullptr);

    outer->finish();
    inner->finish();
}

void test_context_misuse()
{
    ASSERT_THROWS(causal::core::UsageError, ExecutionContext::pop());
    ASSERT_THROWS(causal::core::UsageError, ExecutionContext::push(nullptr));
    ASSERT_EQ(ExecutionContext::depth(), static_cast<size_t>(0));
}

/**
 * @brief Each thread starts with an empty context; pushes never leak across.
 */
void test_context_is_per_thread()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto action = ActionFactory::start_task(logger, "ctx:main");
    auto scope = action->context();

    size_t depth_seen = 99;
    std::thread other([&depth_seen] { depth_seen = ExecutionContext::depth(); });
    other.join();

    ASSERT_EQ(depth_seen, static_cast<size_t>(0));
    ASSERT_TRUE(ExecutionContext::current() == action);
}

/**
 * @brief A `ContextScope` makes new actions children without finishing anything.
 */
void test_context_scope_does_not_finish()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto parent = ActionFactory::start_task(logger, "ctx:parent");

    {
        auto scope = parent->context();
        auto child = ActionFactory::start_action(logger, "ctx:child");
        ASSERT_EQ(child->task_level(), std::string("/1/"));
        ASSERT_EQ(child->task_uuid(), parent->task_uuid());
        child->finish();
    }

    ASSERT_FALSE(parent->finished());
    ASSERT_EQ(ExecutionContext::depth(), static_cast<size_t>(0));
    parent->finish();
}

/**
 * @brief Implicit parenting through the context builds the expected tree.
 *
 * Root under `enter()`, a child, a grandchild started under the child's
 * context, then a sibling of the child back under the root.
 */
void test_implicit_parent_levels()
{
    auto logger = std::make_shared<MemoryLogger>();
    auto root = ActionFactory::start_action(logger, "tree:root");
    ASSERT_EQ(root->task_level(), std::string("/"));

    std::string grandchild_level;
    std::string sibling_level;
    {
        auto root_scope = root->enter();

        auto child = ActionFactory::start_action(logger, "tree:child");
        {
            auto child_scope = child->context();
            auto grandchild = ActionFactory::start_action(logger, "tree:grandchild");
            grandchild_level = grandchild->task_level();
            ASSERT_EQ(grandchild->task_uuid(), root->task_uuid());
            grandchild->finish();
        }
        child->finish();

        auto sibling = ActionFactory::start_action(logger, "tree:sibling");
        sibling_level = sibling->task_level();
        sibling->finish();
    }

    ASSERT_EQ(grandchild_level, std::string("/1/1/"));
    ASSERT_EQ(sibling_level, std::string("/2/"));
    ASSERT_TRUE(root->finished());
    ASSERT_EQ(logger->messages_for(root->task_uuid()).size(), static_cast<size_t>(8));
}

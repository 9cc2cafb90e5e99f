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
 * @file main_test.cpp
 * @brief Central orchestrator for the causal test suite.
 *
 * @details
 * Aggregates the unit tests of every subsystem: Infrastructure, Data Model,
 * Execution Context, Action Lifecycle, Scoped Execution and Deferred Completion.
 */

#include "framework.hpp"

#include "causal/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_uuid_format();
void test_uuid_uniqueness();
void test_uuid_rejects_malformed();
void test_string_demangle();
void test_string_safe_utf8();
void test_logger_parse_level();
void test_logger_threshold();
void test_scheduler_carries_context();
void test_scheduler_defer_rejects_on_throw();
void test_scheduler_without_context();
void test_scheduler_survives_foreign_throw();

// Data Model (fields_test.cpp)
void test_fields_set_and_get();
void test_fields_overwrite_keeps_one_entry();
void test_fields_copy_is_deep();
void test_fields_merge_last_write_wins();
void test_fields_nested_and_parse();
void test_task_level_render();
void test_task_level_parse();
void test_serializers_require_and_chain();
void test_message_without_action();
void test_json_lines_logger();
void test_json_lines_logger_bad_stream();

// Execution Context (context_test.cpp)
void test_context_push_pop();
void test_context_misuse();
void test_context_is_per_thread();
void test_context_scope_does_not_finish();
void test_implicit_parent_levels();

// Action Lifecycle (action_test.cpp)
void test_task_start_message();
void test_start_fields_cannot_spoof_identity();
void test_nested_levels();
void test_start_action_without_parent_is_task();
void test_success_fields();
void test_failure_fields();
void test_finish_is_idempotent();
void test_message_counter_sequence();
void test_success_serializer_rejects();
void test_failure_serializer_applies();
void test_start_serializer_rejects();
void test_action_requires_logger();

// Scoped Execution (scope_test.cpp)
void test_within_returns_and_succeeds();
void test_within_records_exact_failure();
void test_action_scope_success();
void test_action_scope_unwound();
void test_action_scope_explicit_fail();
void test_run_does_not_finish();
void test_bind_restores_context_later();
void test_describe_foreign_exceptions();

// Deferred Completion (deferred_test.cpp)
void test_deferred_runs_continuations_in_order();
void test_deferred_fires_once();
void test_finish_after_success();
void test_finish_after_failure_passes_through();
void test_throwing_continuation_does_not_stop_others();
void test_continuation_after_finish_after_sees_finished();
void test_finish_after_twice_is_usage_error();
void test_finish_after_already_fired();
void test_finish_after_scheduler();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating causal Test Suite...\033[0m" << std::endl;

    causal::infra::Logger::configure_from_env();

    // --- 1. Infrastructure ---
    RUN_TEST(test_uuid_format);
    RUN_TEST(test_uuid_uniqueness);
    RUN_TEST(test_uuid_rejects_malformed);
    RUN_TEST(test_string_demangle);
    RUN_TEST(test_string_safe_utf8);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_scheduler_carries_context);
    RUN_TEST(test_scheduler_defer_rejects_on_throw);
    RUN_TEST(test_scheduler_without_context);
    RUN_TEST(test_scheduler_survives_foreign_throw);

    // --- 2. Data Model ---
    RUN_TEST(test_fields_set_and_get);
    RUN_TEST(test_fields_overwrite_keeps_one_entry);
    RUN_TEST(test_fields_copy_is_deep);
    RUN_TEST(test_fields_merge_last_write_wins);
    RUN_TEST(test_fields_nested_and_parse);
    RUN_TEST(test_task_level_render);
    RUN_TEST(test_task_level_parse);
    RUN_TEST(test_serializers_require_and_chain);
    RUN_TEST(test_message_without_action);
    RUN_TEST(test_json_lines_logger);
    RUN_TEST(test_json_lines_logger_bad_stream);

    // --- 3. Execution Context ---
    RUN_TEST(test_context_push_pop);
    RUN_TEST(test_context_misuse);
    RUN_TEST(test_context_is_per_thread);
    RUN_TEST(test_context_scope_does_not_finish);
    RUN_TEST(test_implicit_parent_levels);

    // --- 4. Action Lifecycle ---
    RUN_TEST(test_task_start_message);
    RUN_TEST(test_start_fields_cannot_spoof_identity);
    RUN_TEST(test_nested_levels);
    RUN_TEST(test_start_action_without_parent_is_task);
    RUN_TEST(test_success_fields);
    RUN_TEST(test_failure_fields);
    RUN_TEST(test_finish_is_idempotent);
    RUN_TEST(test_message_counter_sequence);
    RUN_TEST(test_success_serializer_rejects);
    RUN_TEST(test_failure_serializer_applies);
    RUN_TEST(test_start_serializer_rejects);
    RUN_TEST(test_action_requires_logger);

    // --- 5. Scoped Execution ---
    RUN_TEST(test_within_returns_and_succeeds);
    RUN_TEST(test_within_records_exact_failure);
    RUN_TEST(test_action_scope_success);
    RUN_TEST(test_action_scope_unwound);
    RUN_TEST(test_action_scope_explicit_fail);
    RUN_TEST(test_run_does_not_finish);
    RUN_TEST(test_bind_restores_context_later);
    RUN_TEST(test_describe_foreign_exceptions);

    // --- 6. Deferred Completion ---
    RUN_TEST(test_deferred_runs_continuations_in_order);
    RUN_TEST(test_deferred_fires_once);
    RUN_TEST(test_finish_after_success);
    RUN_TEST(test_finish_after_failure_passes_through);
    RUN_TEST(test_throwing_continuation_does_not_stop_others);
    RUN_TEST(test_continuation_after_finish_after_sees_finished);
    RUN_TEST(test_finish_after_twice_is_usage_error);
    RUN_TEST(test_finish_after_already_fired);
    RUN_TEST(test_finish_after_scheduler);

    causal::test::print_summary();

    return (causal::test::failed_count == 0) ? 0 : 1;
}

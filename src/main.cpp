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
 * @file main.cpp
 * @brief Demonstration driver (`causal_demo`).
 *
 * @details
 * Runs a small order-processing task and writes its action messages as JSON lines:
 * 1. Argument Parsing.
 * 2. Diagnostics configuration (`CAUSAL_LOG_LEVEL`).
 * 3. A task with nested synchronous actions, one of which fails.
 * 4. A child action completed on a worker thread through `finish_after`.
 */

#include "causal/causal.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using causal::core::ActionFactory;
using causal::core::ActionSerializers;
using causal::core::Fields;
using causal::core::MessageLogger;
using causal::core::Serializers;

/// Raised by the inventory step when stock runs out.
class OutOfStock : public std::runtime_error {
  public:
    explicit OutOfStock(const std::string& sku) : std::runtime_error("no stock left for " + sku) {}
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OUTPUT_PATH] [WORKERS]\n"
              << "Options:\n"
              << "  OUTPUT_PATH JSON lines file to write (Default: ./causal_demo.jsonl)\n"
              << "  WORKERS     Background worker threads (Default: 2)\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  CAUSAL_LOG_LEVEL  trace|debug|info|warn|error|fatal (Default: info)\n";
}

int reserve_stock(const std::string& sku, int quantity)
{
    if (sku == "SKU-404") {
        throw OutOfStock(sku);
    }
    return quantity;
}

void process_order(const std::shared_ptr<MessageLogger>& logger,
                   causal::infra::Scheduler& scheduler)
{
    auto checkout = std::make_shared<ActionSerializers>();
    checkout->success = Serializers::require_fields({"reserved"});

    auto order = ActionFactory::start_task(logger, "shop:order", Fields().set("order_id", "A-1001"));
    auto scope = order->enter();

    // Nested synchronous step, succeeds.
    auto reserve = ActionFactory::start_action(logger, "shop:reserve",
                                               Fields().set("sku", "SKU-1").set("quantity", 2),
                                               checkout);
    reserve->within([&] {
        int reserved = reserve_stock("SKU-1", 2);
        reserve->add_success_fields(Fields().set("reserved", reserved));
    });

    // Nested synchronous step, fails; the failure is recorded and handled here.
    auto backorder = ActionFactory::start_action(logger, "shop:reserve",
                                                 Fields().set("sku", "SKU-404"));
    try {
        backorder->within([&] { reserve_stock("SKU-404", 1); });
    } catch (const OutOfStock& e) {
        causal::core::Message::log(*logger, Fields()
                                                .set("message_type", "shop:backorder")
                                                .set("detail", e.what()));
    }

    // Asynchronous step: the action finishes when the worker completes.
    auto invoice = ActionFactory::start_action(logger, "shop:invoice");
    auto rendered = invoice->run([&] {
        return scheduler.defer([] {
            auto pdf = ActionFactory::start_action(
                causal::core::ExecutionContext::current()->logger(), "shop:render_pdf");
            return pdf->within([] { return 4096; });
        });
    });
    invoice->finish_after(rendered);

    // Registered after finish_after, so it fires once the invoice action has finished.
    causal::core::Deferred<int> invoiced;
    rendered.add_callbacks([invoiced](const int& size) mutable { invoiced.resolve(size); },
                           [invoiced](std::exception_ptr error) mutable { invoiced.reject(error); });

    int bytes = invoiced.wait();
    scope->add_success_fields(Fields().set("invoice_bytes", bytes));
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string output_path = "./causal_demo.jsonl";
    size_t workers = 2;

    causal::infra::Logger::configure_from_env();

    try {
        if (argc > 1)
            output_path = argv[1];
        if (argc > 2) {
            long requested = std::stol(argv[2]);
            if (requested < 1) {
                throw std::invalid_argument("WORKERS must be at least 1, got " +
                                            std::string(argv[2]));
            }
            workers = static_cast<size_t>(requested);
        }

        causal::infra::Logger::log(causal::infra::LogLevel::INFO,
                                   "Config: Writing action messages to '" + output_path + "'");

        std::ofstream out(output_path, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot open " + output_path);
        }

        auto logger = std::make_shared<causal::core::JsonLinesLogger>(out);
        {
            causal::infra::Scheduler scheduler(workers);
            process_order(logger, scheduler);
        }

        causal::infra::Logger::log(causal::infra::LogLevel::INFO,
                                   "Demo: " + std::to_string(logger->written()) +
                                       " messages written.");
    } catch (const std::exception& e) {
        causal::infra::Logger::log(causal::infra::LogLevel::FATAL,
                                   "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}

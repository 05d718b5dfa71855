/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "margincore/scenario/ScenarioRunner.hpp"
#include "margincore/common.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"MarginCore v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Scenario config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path checkpoint;
    app.add_option("-c,--checkpoint-file", checkpoint, "Checkpoint to restore before running")
        ->check(CLI::ExistingFile);

    fs::path outputCheckpoint;
    app.add_option("-o,--output-checkpoint", outputCheckpoint, "Checkpoint to write when done");

    fs::path eventLog;
    app.add_option("-l,--event-log", eventLog, "CSV file receiving ledger events");

    bool verbose{};
    app.add_flag("-v,--verbose", verbose, "Log rejections");

    CLI11_PARSE(app, argc, argv);

    fmt::println("{}", app.get_description());

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    auto runner = margincore::scenario::ScenarioRunner::fromConfig(config);
    if (!checkpoint.empty()) {
        runner->restoreCheckpoint(checkpoint);
    }
    if (!eventLog.empty()) {
        runner->attachEventLog(eventLog);
    }

    for (const auto& outcome : runner->run()) {
        fmt::println(" - {}", outcome);
    }

    fmt::println(
        "{}",
        margincore::json::jsonSerializable2str(
            runner->engine(), {.indent = margincore::json::IndentOptions{}}));

    if (!outputCheckpoint.empty()) {
        runner->writeCheckpoint(outputCheckpoint);
    }

    return runner->engine().halted() ? 1 : 0;
}

//-------------------------------------------------------------------------

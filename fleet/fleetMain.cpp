// fleetMain.cpp - taskfleet entry point: dispatcher loop, turn-completion hook, bridge and operator commands.
#include "CommandOptions.hpp"
#include "FleetCommands.hpp"
#include "FleetOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    // stderr only: stdout carries hook decisions, bridge acks and status output.
    auto logger = std::make_shared<Logger>("taskfleet");
    auto stderr_sink = std::make_shared<StderrSink>();
    stderr_sink->set_level(LogLevel::Info);
    logger->add_sink(stderr_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---
        fleet_opts::register_options();
        command_opts::register_options();

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }

        auto settings = fleet_opts::get_settings();
        if (auto level = parse_log_level(settings.log_level)) {
            logger->set_level(*level);
        } else {
            logger->warning("unknown log level '" + settings.log_level + "'; using info");
        }
        auto request = command_opts::get_request();

        // --- Stage 3: Assemble stores, router and dispatcher ---
        auto roster = fleet_opts::get_roster(logger.get());
        if (roster.empty() && request.command == command_opts::Command::Run) {
            logger->warning("no workers configured; the dispatcher has nothing to do");
        }
        FleetApp app(settings, std::move(roster), fleet_opts::get_capability_config(logger.get()), logger);

        // --- Stage 4: Run the selected subcommand ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        return app.execute(request, std::cin, std::cout, shutdown_requested);

    } catch (const std::exception& e) {
        logger->error("Exception in taskfleet: " + std::string(e.what()));
        return 1;
    }
}

// FleetOptions.cpp - Fleet options provider with auto-registration
#include "FleetOptions.hpp"
#include "options/Options.hpp"
#include "logger.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>

namespace {
    std::mutex g_fleet_opts_mtx;
    FleetSettings g_settings;
    nlohmann::json g_config;  // raw root, kept for the workers section
    int g_lock_timeout_ms = 10000;
    int g_tick_interval_ms = 5000;
    int g_nudge_interval_ms = 30000;
    int g_capture_lines = 5;
    int g_keep_read = 20;
    int g_compact_interval_ms = 600000;
    std::atomic<bool> g_fleet_registered{false};
}

namespace fleet_opts {

void register_options() {
    bool expected = false;
    if (!g_fleet_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        FleetSettings defaults;
        int lock_ms = 10000, tick_ms = 5000, nudge_ms = 30000, capture = 5;
        int keep_read = 20, compact_ms = 600000;

        if (j.contains("fleet") && j["fleet"].is_object()) {
            const auto& fj = j["fleet"];
            if (fj.contains("state_dir") && fj["state_dir"].is_string()) defaults.state_dir = fj["state_dir"].get<std::string>();
            if (fj.contains("owner_id") && fj["owner_id"].is_string()) defaults.owner_id = fj["owner_id"].get<std::string>();
            if (fj.contains("lock_timeout_ms") && fj["lock_timeout_ms"].is_number_integer()) lock_ms = fj["lock_timeout_ms"].get<int>();
            if (fj.contains("tick_interval_ms") && fj["tick_interval_ms"].is_number_integer()) tick_ms = fj["tick_interval_ms"].get<int>();
            if (fj.contains("nudge_interval_ms") && fj["nudge_interval_ms"].is_number_integer()) nudge_ms = fj["nudge_interval_ms"].get<int>();
            if (fj.contains("capture_lines") && fj["capture_lines"].is_number_integer()) capture = fj["capture_lines"].get<int>();
            if (fj.contains("keep_read") && fj["keep_read"].is_number_integer()) keep_read = fj["keep_read"].get<int>();
            if (fj.contains("compact_interval_ms") && fj["compact_interval_ms"].is_number_integer()) compact_ms = fj["compact_interval_ms"].get<int>();
            if (fj.contains("log_level") && fj["log_level"].is_string()) defaults.log_level = fj["log_level"].get<std::string>();
        }
        if (j.contains("bridge") && j["bridge"].is_object()) {
            const auto& bj = j["bridge"];
            if (bj.contains("source") && bj["source"].is_string()) defaults.bridge_source = bj["source"].get<std::string>();
            if (bj.contains("ack_prefix") && bj["ack_prefix"].is_string()) defaults.ack_prefix = bj["ack_prefix"].get<std::string>();
        }

        {
            std::lock_guard<std::mutex> lk(g_fleet_opts_mtx);
            g_settings = defaults;
            g_config = j;
            g_lock_timeout_ms = lock_ms;
            g_tick_interval_ms = tick_ms;
            g_nudge_interval_ms = nudge_ms;
            g_capture_lines = capture;
            g_keep_read = keep_read;
            g_compact_interval_ms = compact_ms;
        }

        app.add_option("--state-dir", g_settings.state_dir, "Directory holding inbox/ and tasks/ (default queue)")->group("Fleet");
        app.add_option("--owner", g_settings.owner_id, "Owner mailbox id (default owner)")->group("Fleet");
        app.add_option("--lock-timeout-ms", g_lock_timeout_ms, "Bounded wait for a mailbox or task lock")
            ->check(CLI::Range(1, 600000))->group("Fleet");
        app.add_option("--tick-interval-ms", g_tick_interval_ms, "Dispatcher tick period")
            ->check(CLI::Range(10, 3600000))->group("Fleet");
        app.add_option("--nudge-interval-ms", g_nudge_interval_ms, "Minimum gap between nudges of one worker")
            ->check(CLI::Range(0, 3600000))->group("Fleet");
        app.add_option("--capture-lines", g_capture_lines, "Lines of worker output to classify")
            ->check(CLI::Range(1, 200))->group("Fleet");
        app.add_option("--keep-read", g_keep_read, "Read messages kept per mailbox when compacting")
            ->check(CLI::Range(0, 100000))->group("Fleet");
        app.add_option("--compact-interval-ms", g_compact_interval_ms, "Mailbox compaction period of run (0 disables)")
            ->check(CLI::Range(0, 86400000))->group("Fleet");
        app.add_option("--log-level", g_settings.log_level, "debug|info|warning|error|critical")
            ->check(CLI::IsMember({"debug", "info", "warning", "warn", "error", "critical"}, CLI::ignore_case))
            ->group("Fleet");
        app.add_option("--ack-prefix", g_settings.ack_prefix, "Prefix of bridge acknowledgments")->group("Bridge");
    });
}

FleetSettings get_settings() {
    std::lock_guard<std::mutex> lk(g_fleet_opts_mtx);
    FleetSettings s = g_settings;
    // Config values bypass the CLI range checks; out-of-range ones keep the defaults.
    if (g_lock_timeout_ms > 0) s.lock_timeout = std::chrono::milliseconds(g_lock_timeout_ms);
    if (g_tick_interval_ms > 0) s.tick_interval = std::chrono::milliseconds(g_tick_interval_ms);
    if (g_nudge_interval_ms >= 0) s.nudge_interval = std::chrono::milliseconds(g_nudge_interval_ms);
    if (g_capture_lines > 0) s.capture_lines = static_cast<std::size_t>(g_capture_lines);
    if (g_keep_read >= 0) s.keep_read = static_cast<std::size_t>(g_keep_read);
    if (g_compact_interval_ms >= 0) s.compact_interval = std::chrono::milliseconds(g_compact_interval_ms);

    std::filesystem::path dir(s.state_dir);
    if (dir.is_relative()) {
        if (auto cfg_dir = shared_opts::Options::get_config_dir()) {
            s.state_dir = (*cfg_dir / dir).lexically_normal().string();
        }
    }
    return s;
}

std::vector<TaskFleet::Dispatch::Worker> get_roster(Logger* logger) {
    nlohmann::json root;
    {
        std::lock_guard<std::mutex> lk(g_fleet_opts_mtx);
        root = g_config;
    }
    return TaskFleet::Dispatch::workers_from_json(root, logger);
}

std::optional<TaskFleet::Routing::CapabilityConfig> get_capability_config(Logger* logger) {
    // Tier listing order breaks ties, so read the order-preserving copy.
    return TaskFleet::Routing::CapabilityConfig::from_json(shared_opts::Options::get_ordered_config(), logger);
}

} // namespace fleet_opts

// Static auto-registration object
namespace {
    struct FleetOptsAutoReg {
        FleetOptsAutoReg() { fleet_opts::register_options(); }
    } fleet_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}

/**
 * \file fleet/FleetOptions.hpp
 * \brief `fleet`, `bridge` and `workers` config sections plus their CLI overrides.
 */
#pragma once

#include "dispatch/Worker.hpp"
#include "routing/CapabilityConfig.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

class Logger;

/** \brief Settings shared by every subcommand. */
struct FleetSettings {
    std::string state_dir{"queue"};                 ///< Holds inbox/ and tasks/.
    std::string owner_id{"owner"};                  ///< Human-controlled mailbox.
    std::chrono::milliseconds lock_timeout{10000};
    std::chrono::milliseconds tick_interval{5000};
    std::chrono::milliseconds nudge_interval{30000};
    std::size_t capture_lines{5};
    std::size_t keep_read{20};                      ///< Read messages kept per mailbox by compaction.
    std::chrono::milliseconds compact_interval{600000};  ///< run: compaction period; 0 disables it.
    std::string log_level{"info"};
    std::string bridge_source{"ntfy"};              ///< `from` of bridged messages.
    std::string ack_prefix{"[received] "};
};

namespace fleet_opts {

/**
 * \brief Register the fleet options provider.
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

/**
 * \brief Settings after config and CLI overrides. A relative state_dir is
 * resolved against the config file's directory when a config was loaded.
 */
FleetSettings get_settings();

/** \brief Roster from the `workers` section (empty without a config). */
std::vector<TaskFleet::Dispatch::Worker> get_roster(Logger* logger = nullptr);

/** \brief Capability tiers and routing mode; nullopt disables routing. */
std::optional<TaskFleet::Routing::CapabilityConfig> get_capability_config(Logger* logger = nullptr);

} // namespace fleet_opts

/**
 * \file routing/CapabilityConfig.hpp
 * \brief Capability tier table and routing mode, as read from configuration.
 * \ingroup routing_module
 */
#pragma once

#include "state/CliFamily.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

class Logger;

namespace TaskFleet::Routing {

/**
 * \defgroup routing_module Capability Routing Module
 * \brief Maps a task's Bloom level to the cheapest sufficient model tier.
 */

enum class RoutingMode {
    Auto,    ///< Dispatcher issues model-switch instructions itself.
    Manual,  ///< Dispatcher only tells the owner which model it would pick.
    Off      ///< No routing.
};

std::string to_string(RoutingMode mode);

/**
 * \brief One model's capability ceiling.
 * \ingroup routing_module
 */
struct CapabilityTier {
    std::string model_id;
    int max_bloom = 6;                          ///< Highest Bloom level the model handles, 1..6.
    std::string cost_group;                     ///< Billing pool, used to break ties.
    std::optional<State::CliFamily> cli_family; ///< Program that runs the model, if declared.
};

/**
 * \brief Parsed `capability_tiers` + `routing` config sections.
 * \ingroup routing_module
 *
 * Example:
 * \code
 * "capability_tiers": {
 *   "spark":  {"max_bloom": 3, "cost_group": "chatgpt_pro", "cli_family": "codex"},
 *   "sonnet": {"max_bloom": 5, "cost_group": "claude_max",  "cli_family": "claude"}
 * },
 * "routing": {"mode": "auto", "cost_group_preference": ["chatgpt_pro", "claude_max"]}
 * \endcode
 */
struct CapabilityConfig {
    RoutingMode mode = RoutingMode::Auto;
    std::vector<CapabilityTier> tiers;               ///< In listing order.
    std::vector<std::string> cost_group_preference;  ///< Earlier wins ties.

    const CapabilityTier* find_tier(const std::string& model_id) const;

    /**
     * \brief Read the sections from a config root.
     *
     * Never throws. Entries without a usable `max_bloom` (integer 1..6) are
     * skipped with a warning. Returns nullopt, meaning routing disabled, when
     * the table is missing, is not an object, or has no usable entry.
     * An unrecognised `routing.mode` disables routing.
     */
    static std::optional<CapabilityConfig> from_json(const nlohmann::ordered_json& root, Logger* logger = nullptr);
};

} // namespace TaskFleet::Routing

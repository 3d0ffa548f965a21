#include "CapabilityConfig.hpp"
#include "logger.hpp"

#include <algorithm>

namespace TaskFleet::Routing {

std::string to_string(RoutingMode mode) {
    switch (mode) {
        case RoutingMode::Auto:   return "auto";
        case RoutingMode::Manual: return "manual";
        case RoutingMode::Off:    return "off";
    }
    return "off";
}

const CapabilityTier* CapabilityConfig::find_tier(const std::string& model_id) const {
    auto it = std::find_if(tiers.begin(), tiers.end(),
                           [&](const CapabilityTier& t) { return t.model_id == model_id; });
    return it == tiers.end() ? nullptr : &*it;
}

std::optional<CapabilityConfig> CapabilityConfig::from_json(const nlohmann::ordered_json& root, Logger* logger) {
    auto warn = [logger](const std::string& msg) {
        if (logger) logger->warning("[CapabilityConfig] " + msg);
    };

    if (!root.is_object()) return std::nullopt;
    auto table = root.find("capability_tiers");
    if (table == root.end()) return std::nullopt;
    if (!table->is_object()) {
        warn("capability_tiers is not an object; routing disabled");
        return std::nullopt;
    }

    CapabilityConfig config;
    for (const auto& [model_id, entry] : table->items()) {
        if (!entry.is_object()) {
            warn("tier " + model_id + " is not an object; skipped");
            continue;
        }
        auto bloom = entry.find("max_bloom");
        if (bloom == entry.end() || !bloom->is_number_integer()) {
            warn("tier " + model_id + " has no integer max_bloom; skipped");
            continue;
        }
        int max_bloom = bloom->get<int>();
        if (max_bloom < 1 || max_bloom > 6) {
            warn("tier " + model_id + " max_bloom " + std::to_string(max_bloom) + " outside 1..6; skipped");
            continue;
        }

        CapabilityTier tier;
        tier.model_id = model_id;
        tier.max_bloom = max_bloom;
        if (auto group = entry.find("cost_group"); group != entry.end() && group->is_string()) {
            tier.cost_group = group->get<std::string>();
        }
        if (auto family = entry.find("cli_family"); family != entry.end() && family->is_string()) {
            tier.cli_family = State::parse_cli_family(family->get<std::string>());
            if (!tier.cli_family) warn("tier " + model_id + " names unknown cli_family; treated as undeclared");
        }
        config.tiers.push_back(std::move(tier));
    }

    if (config.tiers.empty()) {
        warn("no usable capability tiers; routing disabled");
        return std::nullopt;
    }

    auto routing = root.find("routing");
    if (routing != root.end() && routing->is_object()) {
        if (auto mode = routing->find("mode"); mode != routing->end() && mode->is_string()) {
            const auto text = mode->get<std::string>();
            if (text == "auto") config.mode = RoutingMode::Auto;
            else if (text == "manual") config.mode = RoutingMode::Manual;
            else if (text == "off") config.mode = RoutingMode::Off;
            else {
                warn("unknown routing mode '" + text + "'; routing off");
                config.mode = RoutingMode::Off;
            }
        }
        if (auto pref = routing->find("cost_group_preference"); pref != routing->end() && pref->is_array()) {
            for (const auto& group : *pref) {
                if (group.is_string()) config.cost_group_preference.push_back(group.get<std::string>());
            }
        }
    }
    return config;
}

} // namespace TaskFleet::Routing

#include "CapabilityRouter.hpp"
#include "FleetError.hpp"

#include <algorithm>
#include <tuple>

namespace TaskFleet::Routing {

CapabilityRouter::CapabilityRouter(std::optional<CapabilityConfig> config)
    : config_(std::move(config)) {
    if (config_ && config_->tiers.empty()) config_.reset();
}

const CapabilityTier* CapabilityRouter::tier(const std::string& model_id) const {
    return config_ ? config_->find_tier(model_id) : nullptr;
}

int CapabilityRouter::capability(const std::string& model_id) const {
    const auto* t = tier(model_id);
    return t ? t->max_bloom : kMaxLevel;
}

std::size_t CapabilityRouter::group_rank(const std::string& cost_group) const {
    const auto& pref = config_->cost_group_preference;
    auto it = std::find(pref.begin(), pref.end(), cost_group);
    if (it != pref.end()) return static_cast<std::size_t>(it - pref.begin());

    // Unlisted groups rank after every preferred one, in order of first appearance.
    std::vector<std::string> seen;
    for (const auto& t : config_->tiers) {
        if (std::find(pref.begin(), pref.end(), t.cost_group) != pref.end()) continue;
        if (std::find(seen.begin(), seen.end(), t.cost_group) == seen.end()) seen.push_back(t.cost_group);
    }
    auto pos = std::find(seen.begin(), seen.end(), cost_group);
    return pref.size() + static_cast<std::size_t>(pos - seen.begin());
}

std::error_code CapabilityRouter::recommend(int bloom_level, std::string& model_id) const {
    if (bloom_level < kMinLevel || bloom_level > kMaxLevel) return FleetErrc::InvalidLevel;
    if (!config_) return FleetErrc::NotConfigured;

    const auto& tiers = config_->tiers;
    const CapabilityTier* best = nullptr;
    std::tuple<int, std::size_t, std::size_t> best_key{};

    // Cheapest sufficient tier.
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        const auto& t = tiers[i];
        if (t.max_bloom < bloom_level) continue;
        auto key = std::make_tuple(t.max_bloom, group_rank(t.cost_group), i);
        if (!best || key < best_key) {
            best = &t;
            best_key = key;
        }
    }

    // Nothing reaches the level: escalate to the most capable tier.
    if (!best) {
        for (std::size_t i = 0; i < tiers.size(); ++i) {
            const auto& t = tiers[i];
            auto key = std::make_tuple(-t.max_bloom, group_rank(t.cost_group), i);
            if (!best || key < best_key) {
                best = &t;
                best_key = key;
            }
        }
    }

    model_id = best->model_id;
    return {};
}

} // namespace TaskFleet::Routing

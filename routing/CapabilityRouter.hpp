// CapabilityRouter.hpp - Cheapest sufficient model tier for a Bloom level
#pragma once

#include "CapabilityConfig.hpp"

#include <optional>
#include <string>
#include <system_error>

namespace TaskFleet::Routing {

/**
 * \brief Pure routing decisions over an optional CapabilityConfig.
 * \ingroup routing_module
 *
 * Holds no state beyond the configuration it was built with; identical inputs
 * always give identical answers.
 */
class CapabilityRouter {
public:
    static constexpr int kMinLevel = 1;
    static constexpr int kMaxLevel = 6;

    /** \param config nullopt disables routing. */
    explicit CapabilityRouter(std::optional<CapabilityConfig> config = std::nullopt);

    /**
     * \brief Cheapest tier that covers \p bloom_level.
     *
     * Among tiers with max_bloom >= level, the smallest max_bloom wins; ties go
     * to the preferred cost group (explicit preference list first, then groups
     * in order of first listing), then to the earlier-listed tier. When no tier
     * is high enough, the tier with the largest max_bloom is returned.
     *
     * \param model_id Receives the recommendation on success.
     * \return FleetErrc::InvalidLevel outside 1..6, FleetErrc::NotConfigured
     *         without a tier table. NotConfigured means "routing disabled".
     */
    std::error_code recommend(int bloom_level, std::string& model_id) const;

    /** \brief max_bloom of \p model_id; 6 when unknown or unconfigured. */
    int capability(const std::string& model_id) const;

    bool configured() const { return config_.has_value(); }

    /** \brief Off when unconfigured. */
    RoutingMode mode() const { return config_ ? config_->mode : RoutingMode::Off; }

    const CapabilityTier* tier(const std::string& model_id) const;

private:
    std::size_t group_rank(const std::string& cost_group) const;

    std::optional<CapabilityConfig> config_;
};

} // namespace TaskFleet::Routing

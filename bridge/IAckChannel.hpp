/**
 * \file bridge/IAckChannel.hpp
 * \brief Outbound side of the external notification channel.
 */
#pragma once

#include <string>
#include <system_error>
#include <vector>

namespace TaskFleet::Bridge {

/** \brief Sends acknowledgments back over the channel the bridge listens on. */
class IAckChannel {
public:
    virtual ~IAckChannel() = default;

    /**
     * \brief Publish \p text with \p tags.
     * \return FleetErrc::ChannelFailure (or a transport error) if not sent.
     */
    virtual std::error_code send(const std::string& text, const std::vector<std::string>& tags) = 0;
};

} // namespace TaskFleet::Bridge

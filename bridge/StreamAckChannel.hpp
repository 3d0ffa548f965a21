// StreamAckChannel.hpp - IAckChannel writing JSON lines for a publisher process
#pragma once

#include "IAckChannel.hpp"

#include <mutex>
#include <ostream>

namespace TaskFleet::Bridge {

/**
 * \brief Writes each acknowledgment as `{"message": ..., "tags": [...]}` plus newline.
 *
 * The bridge command pipes this into whatever posts to the relay, keeping
 * relay credentials out of this process.
 */
class StreamAckChannel : public IAckChannel {
public:
    explicit StreamAckChannel(std::ostream& out) : out_(out) {}

    std::error_code send(const std::string& text, const std::vector<std::string>& tags) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

} // namespace TaskFleet::Bridge

#include "StreamAckChannel.hpp"
#include "FleetError.hpp"

#include <nlohmann/json.hpp>

namespace TaskFleet::Bridge {

std::error_code StreamAckChannel::send(const std::string& text, const std::vector<std::string>& tags) {
    nlohmann::json line{{"message", text}, {"tags", tags}};
    std::lock_guard<std::mutex> lock(mutex_);
    // Replace invalid UTF-8 instead of throwing; content is otherwise passed through as-is.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        return FleetErrc::ChannelFailure;
    }
    return {};
}

} // namespace TaskFleet::Bridge

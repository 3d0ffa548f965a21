// InboundEvent.hpp - External notification event as seen by the bridge
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TaskFleet::Bridge {

/** \brief Tag that marks our own acknowledgments on the shared channel. */
inline constexpr const char* kOutboundTag = "outbound";

/**
 * \brief One event from the external notification stream.
 *
 * Field names on the wire follow the ntfy JSON stream:
 * `event`, `id`, `time`, `message`, `tags`.
 */
struct InboundEvent {
    std::string event_kind;         ///< "message", "keepalive", "open", ...
    std::string id;
    std::int64_t timestamp = 0;     ///< Unix seconds as sent by the relay.
    std::string content;
    std::vector<std::string> tags;

    bool has_tag(const std::string& tag) const;

    /**
     * \brief Decode one JSON line.
     * \return nullopt if the text is not a JSON object or `event` is missing.
     */
    static std::optional<InboundEvent> parse(const std::string& line);
};

} // namespace TaskFleet::Bridge

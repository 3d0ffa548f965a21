#include "InboundEvent.hpp"

#include <algorithm>

namespace TaskFleet::Bridge {

bool InboundEvent::has_tag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::optional<InboundEvent> InboundEvent::parse(const std::string& line) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto kind = j.find("event");
    if (kind == j.end() || !kind->is_string()) return std::nullopt;

    InboundEvent ev;
    ev.event_kind = kind->get<std::string>();
    if (auto it = j.find("id"); it != j.end() && it->is_string()) ev.id = it->get<std::string>();
    if (auto it = j.find("time"); it != j.end() && it->is_number_integer()) ev.timestamp = it->get<std::int64_t>();
    if (auto it = j.find("message"); it != j.end() && it->is_string()) ev.content = it->get<std::string>();
    if (auto it = j.find("tags"); it != j.end() && it->is_array()) {
        for (const auto& tag : *it) {
            if (tag.is_string()) ev.tags.push_back(tag.get<std::string>());
        }
    }
    return ev;
}

} // namespace TaskFleet::Bridge

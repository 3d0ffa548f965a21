#include "Worker.hpp"
#include "logger.hpp"

#include <algorithm>

namespace TaskFleet::Dispatch {

std::vector<Worker> workers_from_json(const nlohmann::json& root, Logger* logger) {
    auto warn = [logger](const std::string& msg) {
        if (logger) logger->warning("[Roster] " + msg);
    };

    auto string_field = [](const nlohmann::json& entry, const char* key, const std::string& fallback) {
        auto it = entry.find(key);
        return (it != entry.end() && it->is_string()) ? it->get<std::string>() : fallback;
    };

    std::vector<Worker> roster;
    if (!root.is_object() || !root.contains("workers")) return roster;
    const auto& list = root["workers"];
    if (!list.is_array()) {
        warn("workers is not an array; roster empty");
        return roster;
    }

    for (const auto& entry : list) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            warn("worker entry without a string id skipped");
            continue;
        }
        Worker w;
        w.id = entry["id"].get<std::string>();
        if (w.id.empty()) {
            warn("worker entry with empty id skipped");
            continue;
        }
        if (std::any_of(roster.begin(), roster.end(), [&](const Worker& o) { return o.id == w.id; })) {
            warn("duplicate worker " + w.id + " skipped");
            continue;
        }
        w.model_id = string_field(entry, "model", "");
        const std::string cli = string_field(entry, "cli", "claude");
        auto family = State::parse_cli_family(cli);
        if (!family) {
            warn("worker " + w.id + " has unknown cli '" + cli + "'; skipped");
            continue;
        }
        w.family = *family;
        w.context_target = string_field(entry, "target", w.id);
        roster.push_back(std::move(w));
    }
    return roster;
}

} // namespace TaskFleet::Dispatch

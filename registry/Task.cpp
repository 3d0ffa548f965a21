#include "Task.hpp"

#include <stdexcept>

namespace TaskFleet::Registry {

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Blocked:  return "blocked";
        case TaskStatus::Assigned: return "assigned";
        case TaskStatus::Done:     return "done";
    }
    return "unknown";
}

std::optional<TaskStatus> parse_task_status(const std::string& text) {
    if (text == "blocked") return TaskStatus::Blocked;
    if (text == "assigned") return TaskStatus::Assigned;
    if (text == "done") return TaskStatus::Done;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Task& t) {
    j = nlohmann::json{
        {"task_id", t.task_id},
        {"parent_id", t.parent_id},
        {"type", t.type},
        {"description", t.description},
        {"blocked_by", t.blocked_by},
        {"status", to_string(t.status)},
        {"timestamp", t.timestamp},
    };
    if (t.bloom_level) j["bloom_level"] = *t.bloom_level;
    if (t.redo_of) j["redo_of"] = *t.redo_of;
}

void from_json(const nlohmann::json& j, Task& t) {
    j.at("task_id").get_to(t.task_id);
    t.parent_id = j.value("parent_id", std::string{});
    t.type = j.value("type", std::string{});
    t.description = j.value("description", std::string{});
    t.timestamp = j.value("timestamp", std::string{});

    t.bloom_level.reset();
    if (auto it = j.find("bloom_level"); it != j.end() && !it->is_null()) {
        t.bloom_level = it->get<int>();
    }
    t.redo_of.reset();
    if (auto it = j.find("redo_of"); it != j.end() && !it->is_null()) {
        t.redo_of = it->get<std::string>();
    }
    t.blocked_by.clear();
    if (auto it = j.find("blocked_by"); it != j.end() && !it->is_null()) {
        it->get_to(t.blocked_by);
    }

    auto status = parse_task_status(j.value("status", std::string{"assigned"}));
    if (!status) {
        throw std::invalid_argument("unknown task status in " + t.task_id);
    }
    t.status = *status;
}

} // namespace TaskFleet::Registry

// Task.hpp - Task descriptor held by the registry
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace TaskFleet::Registry {

/**
 * \brief Task lifecycle. Done is terminal.
 */
enum class TaskStatus {
    Blocked,
    Assigned,
    Done
};

std::string to_string(TaskStatus status);
std::optional<TaskStatus> parse_task_status(const std::string& text);

/**
 * \brief One unit of work. At most one non-done task per worker.
 */
struct Task {
    std::string task_id;                  ///< Immutable, unique across the registry.
    std::string parent_id;                ///< Grouping (the command this task belongs to).
    std::string type;
    std::string description;
    std::optional<int> bloom_level;       ///< Cognitive demand estimate, 1..6.
    std::vector<std::string> blocked_by;  ///< Predecessors that must be done first.
    std::optional<std::string> redo_of;   ///< Done task this one supersedes; write-once.
    TaskStatus status = TaskStatus::Assigned;
    std::string timestamp;                ///< Last transition, local `YYYY-MM-DDTHH:MM:SS`.

    bool is_terminal() const { return status == TaskStatus::Done; }

    /** \brief Status a freshly registered task starts in. */
    TaskStatus initial_status() const {
        return blocked_by.empty() ? TaskStatus::Assigned : TaskStatus::Blocked;
    }
};

void to_json(nlohmann::json& j, const Task& t);

/// Throws nlohmann::json::exception on missing or mistyped fields and
/// std::invalid_argument on an unknown status.
void from_json(const nlohmann::json& j, Task& t);

} // namespace TaskFleet::Registry

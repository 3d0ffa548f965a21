/**
 * \file registry/TaskRegistry.cpp
 * \brief Status transitions, dependency resolution and redo lineage.
 * \ingroup registry_module
 */
#include "TaskRegistry.hpp"
#include "FleetError.hpp"
#include "timeUtils.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace TaskFleet::Registry {

namespace {

constexpr const char* kTaskKey = "task";
constexpr const char* kHistoryKey = "history";

bool valid_bloom(const std::optional<int>& level) {
    return !level || (*level >= 1 && *level <= 6);
}

} // namespace

TaskRegistry::TaskRegistry(std::shared_ptr<Store::IDocumentStore> store,
                           std::shared_ptr<Logger> logger,
                           std::chrono::milliseconds lock_timeout)
    : store_(std::move(store))
    , logger_(std::move(logger))
    , lock_timeout_(lock_timeout) {
    if (!store_) {
        throw std::invalid_argument("TaskRegistry: store cannot be null");
    }
}

bool TaskRegistry::decode(const nlohmann::json& doc, WorkerRecord& record) {
    record = WorkerRecord{};
    if (doc.is_null()) return true;
    if (!doc.is_object()) return false;
    try {
        if (auto it = doc.find(kTaskKey); it != doc.end() && !it->is_null()) {
            record.current = it->get<Task>();
        }
        if (auto it = doc.find(kHistoryKey); it != doc.end() && !it->is_null()) {
            record.history = it->get<std::vector<Task>>();
        }
    } catch (const std::exception&) {
        record = WorkerRecord{};
        return false;
    }
    return true;
}

nlohmann::json TaskRegistry::encode(const WorkerRecord& record) {
    nlohmann::json doc = nlohmann::json::object();
    doc[kTaskKey] = record.current ? nlohmann::json(*record.current) : nlohmann::json(nullptr);
    doc[kHistoryKey] = record.history;
    return doc;
}

std::optional<TaskRegistry::WorkerRecord> TaskRegistry::load_record(const std::string& worker_id) const {
    auto doc = store_->load(worker_id);
    if (!doc) return std::nullopt;
    WorkerRecord record;
    if (!decode(*doc, record)) {
        if (logger_) logger_->warning("[TaskRegistry] unreadable task record for " + worker_id);
        return std::nullopt;
    }
    return record;
}

std::vector<Task> TaskRegistry::all_tasks() const {
    std::vector<Task> tasks;
    for (const auto& worker_id : store_->keys()) {
        auto record = load_record(worker_id);
        if (!record) continue;
        tasks.insert(tasks.end(), record->history.begin(), record->history.end());
        if (record->current) tasks.push_back(*record->current);
    }
    return tasks;
}

std::error_code TaskRegistry::modify(const std::string& worker_id,
                                     const std::function<std::error_code(WorkerRecord&)>& change) {
    return store_->update(worker_id, lock_timeout_, [&](nlohmann::json& doc, bool& dirty) -> std::error_code {
        WorkerRecord record;
        if (!decode(doc, record)) return FleetErrc::CorruptDocument;
        if (auto ec = change(record)) return ec;
        doc = encode(record);
        dirty = true;
        return {};
    });
}

std::optional<Task> TaskRegistry::get(const std::string& worker_id) const {
    auto record = load_record(worker_id);
    if (!record) return std::nullopt;
    return record->current;
}

std::vector<Task> TaskRegistry::history(const std::string& worker_id) const {
    auto record = load_record(worker_id);
    if (!record) return {};
    return record->history;
}

std::vector<std::string> TaskRegistry::worker_ids() const {
    return store_->keys();
}

std::optional<Task> TaskRegistry::find(const std::string& task_id) const {
    for (auto& task : all_tasks()) {
        if (task.task_id == task_id) return task;
    }
    return std::nullopt;
}

bool TaskRegistry::is_done(const std::string& task_id) const {
    auto task = find(task_id);
    return task && task->status == TaskStatus::Done;
}

std::vector<std::string> TaskRegistry::unmet_dependencies(const Task& task) const {
    std::unordered_set<std::string> done;
    for (const auto& t : all_tasks()) {
        if (t.status == TaskStatus::Done) done.insert(t.task_id);
    }
    std::vector<std::string> unmet;
    for (const auto& dep : task.blocked_by) {
        if (done.count(dep) == 0) unmet.push_back(dep);
    }
    return unmet;
}

std::vector<std::string> TaskRegistry::lineage(const std::string& task_id) const {
    const auto tasks = all_tasks();
    auto lookup = [&](const std::string& id) -> const Task* {
        auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& t) { return t.task_id == id; });
        return it == tasks.end() ? nullptr : &*it;
    };

    std::vector<std::string> chain;
    std::unordered_set<std::string> seen;
    const Task* cursor = lookup(task_id);
    while (cursor && seen.insert(cursor->task_id).second) {
        chain.push_back(cursor->task_id);
        if (!cursor->redo_of) break;
        const Task* prev = lookup(*cursor->redo_of);
        if (!prev) {
            // Predecessor record lost; still report the recorded link.
            chain.push_back(*cursor->redo_of);
            break;
        }
        cursor = prev;
    }
    return chain;
}

std::error_code TaskRegistry::check_new_task(const Task& task) const {
    if (task.task_id.empty()) return FleetErrc::InvalidKey;
    if (!valid_bloom(task.bloom_level)) return FleetErrc::InvalidLevel;
    if (std::find(task.blocked_by.begin(), task.blocked_by.end(), task.task_id) != task.blocked_by.end()) {
        return FleetErrc::InvalidTransition;
    }
    if (find(task.task_id)) return FleetErrc::DuplicateTask;
    return {};
}

std::error_code TaskRegistry::set(const std::string& worker_id, Task task) {
    if (auto ec = check_new_task(task)) {
        log_failure("set", worker_id, ec);
        return ec;
    }
    if (task.redo_of) {
        auto prev = find(*task.redo_of);
        if (!prev || prev->status != TaskStatus::Done) {
            log_failure("set", worker_id, FleetErrc::LineageMismatch);
            return FleetErrc::LineageMismatch;
        }
    }

    task.status = task.initial_status();
    task.timestamp = now_timestamp();

    auto ec = modify(worker_id, [&](WorkerRecord& record) -> std::error_code {
        if (record.current) {
            if (!record.current->is_terminal()) return FleetErrc::WorkerBusy;
            record.history.push_back(std::move(*record.current));
        }
        record.current = task;
        return {};
    });
    if (ec) {
        log_failure("set", worker_id, ec);
        return ec;
    }
    if (logger_) {
        logger_->info("[TaskRegistry] " + worker_id + ": registered " + task.task_id + " as " + to_string(task.status));
    }
    return {};
}

std::error_code TaskRegistry::transition(const std::string& worker_id, TaskStatus new_status) {
    auto current = get(worker_id);
    if (!current) return FleetErrc::NoTask;

    // Predecessors resolve against every worker; checked before taking our lock.
    if (current->status == TaskStatus::Blocked && new_status == TaskStatus::Assigned) {
        auto unmet = unmet_dependencies(*current);
        if (!unmet.empty()) {
            if (logger_) {
                logger_->debug("[TaskRegistry] " + current->task_id + " still waits on " + unmet.front() +
                               (unmet.size() > 1 ? " (+" + std::to_string(unmet.size() - 1) + " more)" : std::string{}));
            }
            return FleetErrc::StillBlocked;
        }
    }

    const std::string expected_id = current->task_id;
    TaskStatus from = current->status;
    auto ec = modify(worker_id, [&](WorkerRecord& record) -> std::error_code {
        if (!record.current) return FleetErrc::NoTask;
        auto& task = *record.current;
        // A redo may have replaced the task between the snapshot and the lock.
        if (task.task_id != expected_id || task.status != from) return FleetErrc::InvalidTransition;

        bool allowed = (from == TaskStatus::Blocked && new_status == TaskStatus::Assigned) ||
                       (from == TaskStatus::Assigned && new_status == TaskStatus::Done);
        if (!allowed) return FleetErrc::InvalidTransition;

        task.status = new_status;
        task.timestamp = now_timestamp();
        return {};
    });
    if (ec) {
        log_failure("transition", worker_id, ec);
        return ec;
    }
    if (logger_) {
        logger_->info("[TaskRegistry] " + worker_id + ": " + expected_id + " " + to_string(from) + " -> " + to_string(new_status));
    }
    return {};
}

std::error_code TaskRegistry::redo(const std::string& worker_id, Task new_task) {
    if (auto ec = check_new_task(new_task)) {
        log_failure("redo", worker_id, ec);
        return ec;
    }

    new_task.status = new_task.initial_status();
    new_task.timestamp = now_timestamp();
    std::string replaced;

    auto ec = modify(worker_id, [&](WorkerRecord& record) -> std::error_code {
        if (!record.current) return FleetErrc::NoTask;
        if (!record.current->is_terminal()) return FleetErrc::InvalidTransition;
        if (new_task.redo_of && *new_task.redo_of != record.current->task_id) return FleetErrc::LineageMismatch;

        replaced = record.current->task_id;
        new_task.redo_of = replaced;
        record.history.push_back(std::move(*record.current));
        record.current = new_task;
        return {};
    });
    if (ec) {
        log_failure("redo", worker_id, ec);
        return ec;
    }
    if (logger_) {
        logger_->info("[TaskRegistry] " + worker_id + ": " + new_task.task_id + " supersedes " + replaced);
    }
    return {};
}

void TaskRegistry::log_failure(const std::string& op, const std::string& worker_id, const std::error_code& ec) const {
    if (!logger_) return;
    // StillBlocked is an expected answer, not a failure.
    if (ec == FleetErrc::StillBlocked) return;
    logger_->warning("[TaskRegistry] " + op + " on " + worker_id + " failed: " + ec.message());
}

} // namespace TaskFleet::Registry

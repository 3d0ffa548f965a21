// TaskRegistry.hpp - One active task per worker, dependency gating and redo lineage
#pragma once

#include "Task.hpp"
#include "store/IDocumentStore.hpp"
#include "logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace TaskFleet::Registry {

/**
 * \defgroup registry_module Task Registry Module
 * \brief Task descriptors, status transitions, and cross-worker dependency queries.
 */

/**
 * \brief Task records stored per worker in an IDocumentStore.
 * \ingroup registry_module
 *
 * Document form: `{"task": {...}, "history": [{...}, ...]}`. `task` is the
 * worker's current task; every task it replaced (always done) is kept in
 * `history`, oldest first, so dependencies and redo lineage stay resolvable.
 *
 * Dependency checks scan every worker's document: one worker's completed task
 * can unblock another worker's task. Done is terminal and history is
 * append-only, so a predecessor seen done in a lock-free snapshot stays done.
 */
class TaskRegistry {
public:
    static constexpr std::chrono::milliseconds kDefaultLockTimeout{10000};

    TaskRegistry(std::shared_ptr<Store::IDocumentStore> store,
                 std::shared_ptr<Logger> logger,
                 std::chrono::milliseconds lock_timeout = kDefaultLockTimeout);

    /** \brief Current task of the worker (lock-free snapshot). */
    std::optional<Task> get(const std::string& worker_id) const;

    /**
     * \brief Register a fresh task for the worker.
     *
     * The stored status is blocked when blocked_by is non-empty, otherwise
     * assigned. A done predecessor task moves to the worker's history.
     * \return FleetErrc::WorkerBusy if the current task is not done,
     *         FleetErrc::DuplicateTask if the id is already registered,
     *         FleetErrc::LineageMismatch if redo_of does not name a done task,
     *         FleetErrc::InvalidTransition if the task depends on itself,
     *         FleetErrc::InvalidLevel for a bloom level outside 1..6,
     *         FleetErrc::InvalidKey for an empty task id,
     *         or a store error.
     */
    std::error_code set(const std::string& worker_id, Task task);

    /**
     * \brief Move the worker's current task to \p new_status.
     *
     * Allowed: blocked -> assigned once every blocked_by predecessor is done
     * (FleetErrc::StillBlocked otherwise), assigned -> done. Everything else,
     * including any move out of done, is FleetErrc::InvalidTransition.
     */
    std::error_code transition(const std::string& worker_id, TaskStatus new_status);

    /**
     * \brief Replace the worker's done task with a corrected successor.
     *
     * \p new_task.redo_of is set to the replaced task's id; a different preset
     * value fails with FleetErrc::LineageMismatch. The current task must be done.
     */
    std::error_code redo(const std::string& worker_id, Task new_task);

    /** \brief Look a task up by id in every worker's current task and history. */
    std::optional<Task> find(const std::string& task_id) const;

    bool is_done(const std::string& task_id) const;

    /** \brief Predecessors of \p task that are not done yet, in blocked_by order. */
    std::vector<std::string> unmet_dependencies(const Task& task) const;

    /**
     * \brief Redo chain starting at \p task_id, newest first (C, B, A).
     * \return Empty if the task is unknown.
     */
    std::vector<std::string> lineage(const std::string& task_id) const;

    /** \brief Tasks the worker completed before its current one, oldest first. */
    std::vector<Task> history(const std::string& worker_id) const;

    /** \brief Workers that have a task document. */
    std::vector<std::string> worker_ids() const;

private:
    struct WorkerRecord {
        std::optional<Task> current;
        std::vector<Task> history;
    };

    static bool decode(const nlohmann::json& doc, WorkerRecord& record);
    static nlohmann::json encode(const WorkerRecord& record);

    std::optional<WorkerRecord> load_record(const std::string& worker_id) const;
    std::vector<Task> all_tasks() const;

    /** \brief Locked read-modify-write of one worker's record. */
    std::error_code modify(const std::string& worker_id,
                           const std::function<std::error_code(WorkerRecord&)>& change);

    std::error_code check_new_task(const Task& task) const;
    void log_failure(const std::string& op, const std::string& worker_id, const std::error_code& ec) const;

    std::shared_ptr<Store::IDocumentStore> store_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds lock_timeout_;
};

} // namespace TaskFleet::Registry

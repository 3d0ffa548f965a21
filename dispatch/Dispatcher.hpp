/**
 * \file dispatch/Dispatcher.hpp
 * \brief Per-tick orchestration of task announcements, nudges and resets.
 * \ingroup dispatch_module
 */
#pragma once

#include "IExecutionContext.hpp"
#include "Worker.hpp"
#include "mailbox/MailboxStore.hpp"
#include "registry/TaskRegistry.hpp"
#include "routing/CapabilityRouter.hpp"
#include "state/ActivityClassifier.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace TaskFleet::Dispatch {

/**
 * \defgroup dispatch_module Dispatch Module
 * \brief Moves tasks to workers and keeps workers polling their mailboxes.
 */

/**
 * \brief Where a worker stands, as last observed.
 */
enum class WorkerPhase {
    Blocked,                 ///< Current task waits on predecessors.
    ReadyNoTask,             ///< No task, or the current one is done.
    AssignedIdleUnnotified,  ///< Unread mail, idle, nudge not delivered yet.
    AssignedBusy,            ///< Working; mail waits for the turn-completion hook.
    AssignedIdleNotified,    ///< Idle and either nudged recently or nothing unread.
    Unobserved               ///< Assigned, but its output could not be captured.
};

std::string to_string(WorkerPhase phase);

struct DispatcherSettings {
    std::string owner_id = "owner";                     ///< Mailbox for reports and routing notes.
    std::chrono::milliseconds nudge_interval{30000};    ///< Minimum gap between two nudges of one worker.
    std::size_t capture_lines = State::ActivityClassifier::kTailLines;
};

/// Counters of one tick, mostly for logging and tests.
struct TickSummary {
    std::size_t unblocked = 0;
    std::size_t announced = 0;
    std::size_t nudged = 0;
    std::size_t deferred = 0;
    std::size_t resets = 0;
    std::size_t failures = 0;
};

struct WorkerSnapshot {
    std::string worker_id;
    std::string model_id;
    WorkerPhase phase = WorkerPhase::ReadyNoTask;
    std::optional<State::ActivityState> activity;  ///< Unset when no capture was taken.
    std::size_t unread = 0;
    std::optional<Registry::Task> task;
    bool pending = false;                          ///< Reset or announcement still owed.
};

/**
 * \brief Orchestration core driven by periodic tick() calls.
 * \ingroup dispatch_module
 *
 * Each tick visits the roster in order. For every worker it retries a pending
 * execution-context reset, promotes a blocked task whose predecessors are all
 * done, announces newly assignable tasks (routing first, so a model-switch
 * instruction lands ahead of the task notice) and nudges an idle worker that
 * has unread mail. A busy worker is never nudged.
 *
 * Failed writes are logged and retried on the next tick; the owed work is
 * remembered in memory. No worker is ever dropped from the roster.
 *
 * Thread-safe; calls are serialised on an internal mutex.
 */
class Dispatcher {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    Dispatcher(std::vector<Worker> roster,
               std::shared_ptr<Mailbox::MailboxStore> mailboxes,
               std::shared_ptr<Registry::TaskRegistry> registry,
               std::shared_ptr<const Routing::CapabilityRouter> router,
               std::shared_ptr<IExecutionContext> context,
               DispatcherSettings settings,
               std::shared_ptr<Logger> logger,
               ClockFn clock = &Clock::now);

    /** \brief One pass over the roster. */
    TickSummary tick();

    /**
     * \brief Register \p task for the worker and announce it when it is assignable.
     *
     * \return FleetErrc::UnknownWorker, a registry error (nothing changed), or
     *         success. An announcement that could not be written stays owed
     *         and is retried by tick() and flush_pending().
     */
    std::error_code assign(const std::string& worker_id, Registry::Task task);

    /**
     * \brief Mark the worker's assigned task done and report it to the owner.
     * \return FleetErrc::UnknownWorker, a registry transition error, or the
     *         owner mailbox error (the task stays done in that case).
     */
    std::error_code complete(const std::string& worker_id, const std::string& summary);

    /**
     * \brief Replace the worker's done task with \p task and reset its context.
     *
     * The new task is announced only after the family's reset command went
     * through. A failed reset is retried by tick() and flush_pending().
     * \return FleetErrc::UnknownWorker or a registry error (nothing changed),
     *         otherwise success.
     */
    std::error_code request_redo(const std::string& worker_id, Registry::Task task);

    /**
     * \brief Retry owed resets and announcements without nudging anyone.
     * \return Number of workers still owed something.
     */
    std::size_t flush_pending();

    /** \brief True if a reset or announcement is still owed to the worker. */
    bool has_pending(const std::string& worker_id) const;

    /** \brief Phase, activity and unread count of every worker, in roster order. */
    std::vector<WorkerSnapshot> snapshot() const;

    /** \brief Copy of the roster entry, including any model switch issued so far. */
    std::optional<Worker> worker(const std::string& worker_id) const;

private:
    Worker* find_worker(const std::string& worker_id);
    const Worker* find_worker(const std::string& worker_id) const;

    /** \brief Owed reset; success moves the worker to owed announcement. */
    std::error_code process_reset(Worker& worker, TickSummary& summary);

    /** \brief Owed announcement of the worker's current assigned task. */
    std::error_code process_announcement(Worker& worker, TickSummary& summary);

    /**
     * \brief Model-switch instruction or owner recommendation for \p task.
     *
     * Runs before the task notice. A failed append aborts the announcement.
     */
    std::error_code route(Worker& worker, const Registry::Task& task);

    std::error_code announce(Worker& worker, const Registry::Task& task);

    /** \brief Capture, classify, and nudge when idle with unread mail. */
    WorkerPhase observe(Worker& worker, std::size_t unread, TickSummary& summary);

    std::optional<State::ActivityState> capture_activity(const Worker& worker) const;

    static WorkerPhase phase_for(const std::optional<Registry::Task>& task);

    std::vector<Worker> roster_;
    std::shared_ptr<Mailbox::MailboxStore> mailboxes_;
    std::shared_ptr<Registry::TaskRegistry> registry_;
    std::shared_ptr<const Routing::CapabilityRouter> router_;
    std::shared_ptr<IExecutionContext> context_;
    DispatcherSettings settings_;
    std::shared_ptr<Logger> logger_;
    ClockFn clock_;
    State::ActivityClassifier classifier_;

    mutable std::mutex mutex_;
    std::set<std::string> pending_resets_;
    std::set<std::string> pending_announcements_;
    std::set<std::string> routing_noted_;                    ///< Task ids already recommended to the owner.
    std::map<std::string, Clock::time_point> last_nudge_;
};

} // namespace TaskFleet::Dispatch

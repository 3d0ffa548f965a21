#include "Dispatcher.hpp"
#include "FleetError.hpp"

#include <algorithm>
#include <stdexcept>

namespace TaskFleet::Dispatch {

using Mailbox::Message;
using Registry::Task;
using Registry::TaskStatus;

std::string to_string(WorkerPhase phase) {
    switch (phase) {
        case WorkerPhase::Blocked:                return "blocked";
        case WorkerPhase::ReadyNoTask:            return "ready";
        case WorkerPhase::AssignedIdleUnnotified: return "idle-unnotified";
        case WorkerPhase::AssignedBusy:           return "busy";
        case WorkerPhase::AssignedIdleNotified:   return "idle-notified";
        case WorkerPhase::Unobserved:             return "unobserved";
    }
    return "unknown";
}

Dispatcher::Dispatcher(std::vector<Worker> roster,
                       std::shared_ptr<Mailbox::MailboxStore> mailboxes,
                       std::shared_ptr<Registry::TaskRegistry> registry,
                       std::shared_ptr<const Routing::CapabilityRouter> router,
                       std::shared_ptr<IExecutionContext> context,
                       DispatcherSettings settings,
                       std::shared_ptr<Logger> logger,
                       ClockFn clock)
    : roster_(std::move(roster)),
      mailboxes_(std::move(mailboxes)),
      registry_(std::move(registry)),
      router_(std::move(router)),
      context_(std::move(context)),
      settings_(std::move(settings)),
      logger_(std::move(logger)),
      clock_(std::move(clock)) {
    if (!mailboxes_ || !registry_ || !context_ || !logger_ || !clock_) {
        throw std::invalid_argument("Dispatcher requires mailboxes, registry, context, logger and clock");
    }
    if (!router_) router_ = std::make_shared<Routing::CapabilityRouter>();
}

Worker* Dispatcher::find_worker(const std::string& worker_id) {
    auto it = std::find_if(roster_.begin(), roster_.end(), [&](const Worker& w) { return w.id == worker_id; });
    return it == roster_.end() ? nullptr : &*it;
}

const Worker* Dispatcher::find_worker(const std::string& worker_id) const {
    auto it = std::find_if(roster_.begin(), roster_.end(), [&](const Worker& w) { return w.id == worker_id; });
    return it == roster_.end() ? nullptr : &*it;
}

std::optional<Worker> Dispatcher::worker(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    const Worker* w = find_worker(worker_id);
    if (!w) return std::nullopt;
    return *w;
}

bool Dispatcher::has_pending(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_resets_.count(worker_id) > 0 || pending_announcements_.count(worker_id) > 0;
}

// --- Tick -------------------------------------------------------------------

TickSummary Dispatcher::tick() {
    std::lock_guard<std::mutex> lk(mutex_);
    TickSummary summary;

    for (auto& w : roster_) {
        // A redo is announced only once the old conversation is gone.
        if (pending_resets_.count(w.id) && process_reset(w, summary)) continue;

        auto task = registry_->get(w.id);
        if (!task || task->is_terminal()) {
            pending_announcements_.erase(w.id);
            continue;
        }

        if (task->status == TaskStatus::Blocked) {
            auto ec = registry_->transition(w.id, TaskStatus::Assigned);
            if (ec == FleetErrc::StillBlocked) continue;
            if (ec) {
                ++summary.failures;
                continue;
            }
            ++summary.unblocked;
            logger_->info("[Dispatcher] " + task->task_id + " on " + w.id + " unblocked");
            pending_announcements_.insert(w.id);
        }

        if (pending_announcements_.count(w.id) && process_announcement(w, summary)) continue;

        std::size_t unread = mailboxes_->unread_count(w.id);
        if (unread > 0) observe(w, unread, summary);
    }

    if (summary.unblocked || summary.announced || summary.nudged || summary.resets || summary.failures) {
        logger_->debug("[Dispatcher] tick: unblocked=" + std::to_string(summary.unblocked) +
                       " announced=" + std::to_string(summary.announced) +
                       " nudged=" + std::to_string(summary.nudged) +
                       " deferred=" + std::to_string(summary.deferred) +
                       " resets=" + std::to_string(summary.resets) +
                       " failures=" + std::to_string(summary.failures));
    }
    return summary;
}

std::size_t Dispatcher::flush_pending() {
    std::lock_guard<std::mutex> lk(mutex_);
    TickSummary summary;
    std::size_t remaining = 0;
    for (auto& w : roster_) {
        if (pending_resets_.count(w.id) && process_reset(w, summary)) {
            ++remaining;
            continue;
        }
        if (pending_announcements_.count(w.id) && process_announcement(w, summary)) ++remaining;
    }
    return remaining;
}

std::error_code Dispatcher::process_reset(Worker& worker, TickSummary& summary) {
    const auto& profile = State::profile_for(worker.family);
    auto ec = context_->send_control(worker, profile.reset_command);
    if (ec) {
        ++summary.failures;
        logger_->warning("[Dispatcher] reset " + profile.reset_command + " for " + worker.id +
                         " failed: " + ec.message() + "; will retry");
        return ec;
    }
    ++summary.resets;
    // A fresh conversation starts with a fresh turn.
    worker.deferral = TurnDeferral::NotDeferred;
    pending_resets_.erase(worker.id);
    pending_announcements_.insert(worker.id);
    logger_->info("[Dispatcher] " + worker.id + " reset with " + profile.reset_command);
    return {};
}

std::error_code Dispatcher::process_announcement(Worker& worker, TickSummary& summary) {
    auto task = registry_->get(worker.id);
    // Blocked tasks get announced when they unblock; done ones never.
    if (!task || task->status != TaskStatus::Assigned) {
        pending_announcements_.erase(worker.id);
        return {};
    }

    auto ec = route(worker, *task);
    if (!ec) ec = announce(worker, *task);
    if (ec) {
        ++summary.failures;
        logger_->warning("[Dispatcher] announcing " + task->task_id + " to " + worker.id +
                         " failed: " + ec.message() + "; will retry");
        return ec;
    }
    ++summary.announced;
    pending_announcements_.erase(worker.id);
    return {};
}

std::error_code Dispatcher::route(Worker& worker, const Task& task) {
    if (!task.bloom_level || !router_->configured()) return {};
    const auto mode = router_->mode();
    if (mode == Routing::RoutingMode::Off) return {};

    const int level = *task.bloom_level;
    const int current = router_->capability(worker.model_id);
    if (level <= current) return {};

    std::string model;
    if (auto ec = router_->recommend(level, model)) {
        logger_->debug("[Dispatcher] no recommendation for " + task.task_id + ": " + ec.message());
        return {};
    }
    if (model == worker.model_id) return {};

    const auto* tier = router_->tier(model);
    if (tier && tier->cli_family && *tier->cli_family != worker.family) {
        logger_->info("[Dispatcher] " + task.task_id + " wants " + model + " (" +
                      State::to_string(*tier->cli_family) + ") but " + worker.id + " runs " +
                      State::to_string(worker.family) + "; model switch skipped");
        return {};
    }

    const std::string detail = "bloom " + std::to_string(level) + " exceeds " +
                               (worker.model_id.empty() ? std::string{"current model"} : worker.model_id) +
                               " (max " + std::to_string(current) + ")";

    if (mode == Routing::RoutingMode::Auto) {
        Message msg;
        msg.from = settings_.owner_id;
        msg.type = Mailbox::message_types::ModelSwitch;
        msg.content = "Switch to model " + model + " before starting " + task.task_id + ": " + detail;
        if (auto ec = mailboxes_->append(worker.id, std::move(msg))) return ec;
        logger_->info("[Dispatcher] " + worker.id + " switched " + worker.model_id + " -> " + model +
                      " for " + task.task_id);
        worker.model_id = model;
        return {};
    }

    if (routing_noted_.count(task.task_id)) return {};
    Message msg;
    msg.from = worker.id;
    msg.type = Mailbox::message_types::Info;
    msg.content = "Recommend model " + model + " for " + task.task_id + " on " + worker.id + ": " + detail;
    if (auto ec = mailboxes_->append(settings_.owner_id, std::move(msg))) return ec;
    routing_noted_.insert(task.task_id);
    return {};
}

std::error_code Dispatcher::announce(Worker& worker, const Task& task) {
    Message msg;
    msg.from = settings_.owner_id;
    msg.type = Mailbox::message_types::TaskAssigned;
    msg.content = "Task " + task.task_id;
    if (!task.type.empty()) msg.content += " (" + task.type + ")";
    msg.content += " assigned";
    if (task.redo_of) msg.content += " as redo of " + *task.redo_of;
    if (!task.description.empty()) msg.content += ": " + task.description;

    if (auto ec = mailboxes_->append(worker.id, std::move(msg))) return ec;
    logger_->info("[Dispatcher] announced " + task.task_id + " to " + worker.id);
    return {};
}

std::optional<State::ActivityState> Dispatcher::capture_activity(const Worker& worker) const {
    auto capture = context_->capture_tail(worker, settings_.capture_lines);
    if (!capture) return std::nullopt;
    return classifier_.classify_capture(*capture);
}

WorkerPhase Dispatcher::observe(Worker& worker, std::size_t unread, TickSummary& summary) {
    auto activity = capture_activity(worker);
    if (!activity || *activity == State::ActivityState::Absent) {
        logger_->debug("[Dispatcher] " + worker.id + " unobserved; skipped this tick");
        return WorkerPhase::Unobserved;
    }
    if (*activity == State::ActivityState::Busy) {
        ++summary.deferred;
        return WorkerPhase::AssignedBusy;
    }

    const auto now = clock_();
    auto last = last_nudge_.find(worker.id);
    if (last != last_nudge_.end() && now - last->second < settings_.nudge_interval) {
        return WorkerPhase::AssignedIdleNotified;
    }

    if (context_->send_control(worker, "inbox" + std::to_string(unread))) {
        ++summary.failures;
        return WorkerPhase::AssignedIdleUnnotified;
    }
    last_nudge_[worker.id] = now;
    ++summary.nudged;
    logger_->info("[Dispatcher] nudged " + worker.id + " (" + std::to_string(unread) + " unread)");
    return WorkerPhase::AssignedIdleNotified;
}

WorkerPhase Dispatcher::phase_for(const std::optional<Task>& task) {
    if (!task || task->is_terminal()) return WorkerPhase::ReadyNoTask;
    if (task->status == TaskStatus::Blocked) return WorkerPhase::Blocked;
    return WorkerPhase::AssignedIdleNotified;
}

// --- Operator commands ------------------------------------------------------

std::error_code Dispatcher::assign(const std::string& worker_id, Task task) {
    std::lock_guard<std::mutex> lk(mutex_);
    Worker* w = find_worker(worker_id);
    if (!w) return FleetErrc::UnknownWorker;

    const bool assignable = task.initial_status() == TaskStatus::Assigned;
    const std::string task_id = task.task_id;
    if (auto ec = registry_->set(worker_id, std::move(task))) return ec;
    logger_->info("[Dispatcher] " + task_id + " registered for " + worker_id +
                  (assignable ? "" : " (blocked)"));

    if (assignable) {
        pending_announcements_.insert(worker_id);
        TickSummary summary;
        // A failed announcement stays owed and is retried by tick().
        process_announcement(*w, summary);
    }
    return {};
}

std::error_code Dispatcher::complete(const std::string& worker_id, const std::string& summary) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!find_worker(worker_id)) return FleetErrc::UnknownWorker;

    auto task = registry_->get(worker_id);
    if (!task) return FleetErrc::NoTask;
    if (auto ec = registry_->transition(worker_id, TaskStatus::Done)) return ec;
    pending_announcements_.erase(worker_id);

    Message report;
    report.from = worker_id;
    report.type = Mailbox::message_types::ReportReceived;
    report.content = task->task_id + " done";
    if (!summary.empty()) report.content += ": " + summary;
    if (auto ec = mailboxes_->append(settings_.owner_id, std::move(report))) {
        logger_->error("[Dispatcher] " + task->task_id + " is done but the report to " +
                       settings_.owner_id + " failed: " + ec.message());
        return ec;
    }
    logger_->info("[Dispatcher] " + worker_id + " completed " + task->task_id);
    return {};
}

std::error_code Dispatcher::request_redo(const std::string& worker_id, Task task) {
    std::lock_guard<std::mutex> lk(mutex_);
    Worker* w = find_worker(worker_id);
    if (!w) return FleetErrc::UnknownWorker;

    const std::string task_id = task.task_id;
    if (auto ec = registry_->redo(worker_id, std::move(task))) return ec;
    logger_->info("[Dispatcher] " + task_id + " replaces the done task of " + worker_id);

    pending_announcements_.erase(worker_id);
    pending_resets_.insert(worker_id);
    TickSummary summary;
    // Failures stay owed and are retried by tick().
    if (!process_reset(*w, summary)) process_announcement(*w, summary);
    return {};
}

std::vector<WorkerSnapshot> Dispatcher::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<WorkerSnapshot> out;
    out.reserve(roster_.size());
    const auto now = clock_();

    for (const auto& w : roster_) {
        WorkerSnapshot snap;
        snap.worker_id = w.id;
        snap.model_id = w.model_id;
        snap.task = registry_->get(w.id);
        snap.unread = mailboxes_->unread_count(w.id);
        snap.pending = pending_resets_.count(w.id) > 0 || pending_announcements_.count(w.id) > 0;
        snap.phase = phase_for(snap.task);

        if (snap.phase == WorkerPhase::AssignedIdleNotified) {
            snap.activity = capture_activity(w);
            if (!snap.activity || *snap.activity == State::ActivityState::Absent) {
                snap.phase = WorkerPhase::Unobserved;
            } else if (*snap.activity == State::ActivityState::Busy) {
                snap.phase = WorkerPhase::AssignedBusy;
            } else if (snap.unread > 0) {
                auto last = last_nudge_.find(w.id);
                bool recent = last != last_nudge_.end() && now - last->second < settings_.nudge_interval;
                snap.phase = recent ? WorkerPhase::AssignedIdleNotified : WorkerPhase::AssignedIdleUnnotified;
            }
        }
        out.push_back(std::move(snap));
    }
    return out;
}

} // namespace TaskFleet::Dispatch

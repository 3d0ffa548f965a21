// FleetCommands.cpp - Subcommand implementations
#include "FleetCommands.hpp"
#include "FleetError.hpp"
#include "bridge/StreamAckChannel.hpp"
#include "dispatch/TmuxExecutionContext.hpp"
#include "store/FileDocumentStore.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace TaskFleet;
using command_opts::Command;
using command_opts::CommandRequest;

namespace {
    constexpr int kSettleAttempts = 3;
    constexpr auto kSettleDelay = std::chrono::seconds(1);
    constexpr auto kStopPollInterval = std::chrono::milliseconds(100);
}

FleetApp::FleetApp(FleetSettings settings,
                   std::vector<Dispatch::Worker> roster,
                   std::optional<Routing::CapabilityConfig> capability,
                   std::shared_ptr<Logger> logger,
                   std::shared_ptr<Dispatch::IExecutionContext> context)
    : settings_(std::move(settings)), logger_(std::move(logger)), context_(std::move(context)) {
    for (const auto& w : roster) worker_ids_.push_back(w.id);

    const std::filesystem::path root(settings_.state_dir);
    auto inbox_store = std::make_shared<Store::FileDocumentStore>(root / "inbox", logger_);
    auto task_store = std::make_shared<Store::FileDocumentStore>(root / "tasks", logger_);

    mailboxes_ = std::make_shared<Mailbox::MailboxStore>(inbox_store, logger_, settings_.lock_timeout);
    registry_ = std::make_shared<Registry::TaskRegistry>(task_store, logger_, settings_.lock_timeout);
    router_ = std::make_shared<Routing::CapabilityRouter>(std::move(capability));
    if (!context_) context_ = std::make_shared<Dispatch::TmuxExecutionContext>(logger_);

    Dispatch::DispatcherSettings ds;
    ds.owner_id = settings_.owner_id;
    ds.nudge_interval = settings_.nudge_interval;
    ds.capture_lines = settings_.capture_lines;
    dispatcher_ = std::make_unique<Dispatch::Dispatcher>(std::move(roster), mailboxes_, registry_, router_,
                                                         context_, ds, logger_);
}

int FleetApp::execute(const CommandRequest& request, std::istream& in, std::ostream& out,
                      const std::atomic<bool>& stop) {
    switch (request.command) {
        case Command::Run:       return run_loop(request.once, stop);
        case Command::Hook:      return run_hook(request, in, out);
        case Command::Bridge:    return run_bridge(request, in, out, stop);
        case Command::Assign:    return assign(request, false);
        case Command::Redo:      return assign(request, true);
        case Command::Complete:  return complete(request);
        case Command::Send:      return send(request);
        case Command::Status:    return status(request, out);
        case Command::Recommend: return recommend(request, out);
        case Command::Compact:   return compact(request);
        case Command::None:      break;
    }
    logger_->error("no subcommand selected");
    return 2;
}

int FleetApp::run_loop(bool once, const std::atomic<bool>& stop) {
    logger_->info("dispatcher started (tick " + std::to_string(settings_.tick_interval.count()) + " ms, " +
                  "routing " + Routing::to_string(router_->mode()) + ")");
    const bool compacting = settings_.compact_interval.count() > 0;
    auto next_compaction = std::chrono::steady_clock::now() + settings_.compact_interval;

    while (!stop.load(std::memory_order_relaxed)) {
        dispatcher_->tick();
        if (compacting && std::chrono::steady_clock::now() >= next_compaction) {
            compact_all();
            next_compaction = std::chrono::steady_clock::now() + settings_.compact_interval;
        }
        if (once) break;

        // Sleep in short slices so a signal stops the loop promptly.
        auto deadline = std::chrono::steady_clock::now() + settings_.tick_interval;
        while (!stop.load(std::memory_order_relaxed) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kStopPollInterval);
        }
    }
    logger_->info("dispatcher stopped");
    return 0;
}

int FleetApp::run_hook(const CommandRequest& request, std::istream& in, std::ostream& out) {
    std::string worker_id = request.worker;
    if (worker_id.empty()) {
        if (const char* env = std::getenv("TASKFLEET_WORKER_ID")) worker_id = env;
    }

    Dispatch::HookSettings hs;
    hs.owner_id = settings_.owner_id;
    hs.mailbox_dir = (std::filesystem::path(settings_.state_dir) / "inbox").string();
    Dispatch::TurnCompletionHook hook(mailboxes_, hs, logger_);

    auto decision = hook.evaluate_payload(worker_id, in);
    if (!decision.allow) out << decision.to_json_line() << std::endl;
    return 0;
}

int FleetApp::run_bridge(const CommandRequest& request, std::istream& in, std::ostream& out,
                         const std::atomic<bool>& stop) {
    std::ofstream ack_file;
    if (!request.ack_out.empty()) {
        ack_file.open(request.ack_out, std::ios::app);
        if (!ack_file) {
            logger_->error("cannot open acknowledgment file " + request.ack_out);
            return 1;
        }
    }
    std::ostream& ack_stream = request.ack_out.empty() ? out : static_cast<std::ostream&>(ack_file);

    Bridge::BridgeSettings bs;
    bs.owner_id = settings_.owner_id;
    bs.source = settings_.bridge_source;
    bs.ack_prefix = settings_.ack_prefix;
    Bridge::NotificationBridge bridge(mailboxes_, std::make_shared<Bridge::StreamAckChannel>(ack_stream), bs, logger_);

    std::size_t delivered = 0, failed = 0;
    std::string line;
    while (!stop.load(std::memory_order_relaxed) && std::getline(in, line)) {
        if (line.empty()) continue;
        auto event = Bridge::InboundEvent::parse(line);
        if (!event) {
            logger_->warning("[Bridge] unparsable event line skipped");
            continue;
        }
        auto result = bridge.on_external_event(*event);
        if (result.outcome == Bridge::BridgeOutcome::Delivered ||
            result.outcome == Bridge::BridgeOutcome::DeliveredAckFailed) {
            ++delivered;
        } else if (result.outcome == Bridge::BridgeOutcome::AppendFailed) {
            ++failed;
        }
    }
    logger_->info("[Bridge] input closed: " + std::to_string(delivered) + " delivered, " +
                  std::to_string(failed) + " failed");
    return failed == 0 ? 0 : 1;
}

int FleetApp::settle(const std::string& worker_id) {
    for (int attempt = 0; attempt < kSettleAttempts && dispatcher_->has_pending(worker_id); ++attempt) {
        std::this_thread::sleep_for(kSettleDelay);
        dispatcher_->flush_pending();
    }
    if (dispatcher_->has_pending(worker_id)) {
        logger_->error(worker_id + " still has an unsent reset or announcement; the running dispatcher will not know about it");
        return 1;
    }
    return 0;
}

int FleetApp::assign(const CommandRequest& request, bool redo) {
    auto ec = redo ? dispatcher_->request_redo(request.worker, request.task)
                   : dispatcher_->assign(request.worker, request.task);
    if (ec) {
        logger_->error(std::string(redo ? "redo" : "assign") + " of " + request.task.task_id + " to " +
                       request.worker + " failed: " + ec.message());
        return ec == FleetErrc::UnknownWorker ? 2 : 1;
    }
    return settle(request.worker);
}

int FleetApp::complete(const CommandRequest& request) {
    if (auto ec = dispatcher_->complete(request.worker, request.summary)) {
        logger_->error("complete for " + request.worker + " failed: " + ec.message());
        return ec == FleetErrc::UnknownWorker ? 2 : 1;
    }
    return 0;
}

int FleetApp::send(const CommandRequest& request) {
    Mailbox::Message msg;
    msg.from = request.from;
    msg.type = request.type;
    msg.content = request.content;
    std::string id;
    if (auto ec = mailboxes_->append(request.worker, std::move(msg), &id)) {
        logger_->error("send to " + request.worker + " failed: " + ec.message());
        return 1;
    }
    logger_->info("sent " + id + " to " + request.worker);
    return 0;
}

int FleetApp::status(const CommandRequest& request, std::ostream& out) {
    auto snapshot = dispatcher_->snapshot();

    if (request.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& s : snapshot) {
            nlohmann::json w;
            w["worker"] = s.worker_id;
            w["model"] = s.model_id;
            w["phase"] = Dispatch::to_string(s.phase);
            w["activity"] = s.activity ? nlohmann::json(State::to_string(*s.activity)) : nlohmann::json(nullptr);
            w["unread"] = s.unread;
            w["task"] = s.task ? nlohmann::json(*s.task) : nlohmann::json(nullptr);
            w["pending"] = s.pending;
            j.push_back(std::move(w));
        }
        out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return 0;
    }

    out << std::left << std::setw(14) << "WORKER" << std::setw(12) << "MODEL" << std::setw(17) << "PHASE"
        << std::setw(8) << "UNREAD" << "TASK" << '\n';
    for (const auto& s : snapshot) {
        out << std::left << std::setw(14) << s.worker_id << std::setw(12) << s.model_id
            << std::setw(17) << Dispatch::to_string(s.phase) << std::setw(8) << s.unread;
        if (s.task) out << s.task->task_id << " [" << Registry::to_string(s.task->status) << "]";
        if (s.pending) out << " (pending)";
        out << '\n';
    }
    out << "owner " << settings_.owner_id << ": " << mailboxes_->unread_count(settings_.owner_id) << " unread"
        << std::endl;
    return 0;
}

int FleetApp::recommend(const CommandRequest& request, std::ostream& out) {
    if (router_->configured() && router_->mode() == Routing::RoutingMode::Off) {
        out << "routing off (routing.mode is off)" << std::endl;
        return 0;
    }
    std::string model;
    auto ec = router_->recommend(request.level, model);
    if (ec == FleetErrc::NotConfigured) {
        out << "routing disabled (no capability tiers configured)" << std::endl;
        return 0;
    }
    if (ec) {
        logger_->error("recommend " + std::to_string(request.level) + ": " + ec.message());
        return 2;
    }
    out << model << std::endl;
    return 0;
}

std::size_t FleetApp::compact_all() {
    std::vector<std::string> ids = worker_ids_;
    if (std::find(ids.begin(), ids.end(), settings_.owner_id) == ids.end()) ids.push_back(settings_.owner_id);

    std::size_t failures = 0;
    for (const auto& id : ids) {
        if (mailboxes_->compact(id, settings_.keep_read)) ++failures;
    }
    return failures;
}

int FleetApp::compact(const CommandRequest& request) {
    if (request.worker.empty()) return compact_all() == 0 ? 0 : 1;

    std::size_t removed = 0;
    if (auto ec = mailboxes_->compact(request.worker, settings_.keep_read, &removed)) {
        logger_->error("compact of " + request.worker + " failed: " + ec.message());
        return 1;
    }
    logger_->info(request.worker + ": " + std::to_string(removed) + " read message(s) dropped");
    return 0;
}

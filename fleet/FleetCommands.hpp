// FleetCommands.hpp - Wires the stores, router and dispatcher together for each subcommand
#pragma once

#include "CommandOptions.hpp"
#include "FleetOptions.hpp"
#include "bridge/NotificationBridge.hpp"
#include "dispatch/Dispatcher.hpp"
#include "dispatch/TurnCompletionHook.hpp"
#include "logger.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * \brief Process-level composition of the fleet components.
 *
 * Mailboxes live under `<state_dir>/inbox`, task records under
 * `<state_dir>/tasks`. Exit codes: 0 success, 1 operation failed,
 * 2 bad arguments.
 */
class FleetApp {
public:
    /**
     * \param context Execution context; nullptr selects tmux.
     * \throws std::system_error if the state directories cannot be created.
     */
    FleetApp(FleetSettings settings,
             std::vector<TaskFleet::Dispatch::Worker> roster,
             std::optional<TaskFleet::Routing::CapabilityConfig> capability,
             std::shared_ptr<Logger> logger,
             std::shared_ptr<TaskFleet::Dispatch::IExecutionContext> context = nullptr);

    int execute(const command_opts::CommandRequest& request,
                std::istream& in, std::ostream& out,
                const std::atomic<bool>& stop);

    TaskFleet::Dispatch::Dispatcher& dispatcher() { return *dispatcher_; }
    TaskFleet::Mailbox::MailboxStore& mailboxes() { return *mailboxes_; }
    TaskFleet::Registry::TaskRegistry& registry() { return *registry_; }

private:
    int run_loop(bool once, const std::atomic<bool>& stop);
    int run_hook(const command_opts::CommandRequest& request, std::istream& in, std::ostream& out);
    int run_bridge(const command_opts::CommandRequest& request, std::istream& in, std::ostream& out,
                   const std::atomic<bool>& stop);
    int assign(const command_opts::CommandRequest& request, bool redo);
    int complete(const command_opts::CommandRequest& request);
    int send(const command_opts::CommandRequest& request);
    int status(const command_opts::CommandRequest& request, std::ostream& out);
    int recommend(const command_opts::CommandRequest& request, std::ostream& out);
    int compact(const command_opts::CommandRequest& request);

    /** \brief Compact every worker mailbox and the owner's. \return Number of failures. */
    std::size_t compact_all();

    /** \brief Retry owed resets and announcements a few times before giving up. */
    int settle(const std::string& worker_id);

    FleetSettings settings_;
    std::vector<std::string> worker_ids_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<TaskFleet::Mailbox::MailboxStore> mailboxes_;
    std::shared_ptr<TaskFleet::Registry::TaskRegistry> registry_;
    std::shared_ptr<TaskFleet::Routing::CapabilityRouter> router_;
    std::shared_ptr<TaskFleet::Dispatch::IExecutionContext> context_;
    std::unique_ptr<TaskFleet::Dispatch::Dispatcher> dispatcher_;
};

// CommandOptions.cpp - Subcommand provider with auto-registration
#include "CommandOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_cmd_opts_mtx;
    command_opts::CommandRequest g_request;
    std::optional<int> g_bloom;
    std::atomic<bool> g_cmd_registered{false};

    void select(command_opts::Command c) {
        std::lock_guard<std::mutex> lk(g_cmd_opts_mtx);
        g_request.command = c;
    }

    // Options shared by `assign` and `redo`.
    void add_task_options(CLI::App* sub) {
        sub->add_option("worker", g_request.worker, "Worker id")->required();
        sub->add_option("--task-id", g_request.task.task_id, "Unique task id")->required();
        sub->add_option("--parent", g_request.task.parent_id, "Parent command id");
        sub->add_option("--type", g_request.task.type, "Task type");
        sub->add_option("-d,--description", g_request.task.description, "What the worker should do");
        sub->add_option("--bloom", g_bloom, "Bloom level 1..6")->check(CLI::Range(1, 6));
        sub->add_option("--blocked-by", g_request.task.blocked_by, "Predecessor task ids")->delimiter(',');
    }
}

namespace command_opts {

void register_options() {
    bool expected = false;
    if (!g_cmd_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json&){
        {
            std::lock_guard<std::mutex> lk(g_cmd_opts_mtx);
            g_request = CommandRequest{};
            g_request.from = "owner";
            g_request.type = "info";
            g_bloom.reset();
        }

        auto* run = app.add_subcommand("run", "Run the dispatcher loop");
        run->add_flag("--once", g_request.once, "Run a single tick and exit");
        run->callback([]{ select(Command::Run); });

        auto* hook = app.add_subcommand("hook", "Turn-completion hook: reads the hook payload on stdin");
        hook->add_option("--worker", g_request.worker, "Worker id (default $TASKFLEET_WORKER_ID)");
        hook->callback([]{ select(Command::Hook); });

        auto* bridge = app.add_subcommand("bridge", "Deliver ntfy JSON lines from stdin to the owner mailbox");
        bridge->add_option("--ack-out", g_request.ack_out, "Append acknowledgments to this file instead of stdout");
        bridge->callback([]{ select(Command::Bridge); });

        auto* assign = app.add_subcommand("assign", "Register a task for a worker and announce it");
        add_task_options(assign);
        assign->callback([]{ select(Command::Assign); });

        auto* complete = app.add_subcommand("complete", "Mark a worker's task done and report to the owner");
        complete->add_option("worker", g_request.worker, "Worker id")->required();
        complete->add_option("-s,--summary", g_request.summary, "Short report");
        complete->callback([]{ select(Command::Complete); });

        auto* redo = app.add_subcommand("redo", "Replace a worker's done task with a corrected one");
        add_task_options(redo);
        redo->callback([]{ select(Command::Redo); });

        auto* send = app.add_subcommand("send", "Append a message to a mailbox");
        send->add_option("worker", g_request.worker, "Recipient mailbox")->required();
        send->add_option("content", g_request.content, "Message text")->required();
        send->add_option("--from", g_request.from, "Sender (default owner)");
        send->add_option("--type", g_request.type, "Message type (default info)");
        send->callback([]{ select(Command::Send); });

        auto* status = app.add_subcommand("status", "Show every worker's phase, task and unread count");
        status->add_flag("--json", g_request.json, "Print JSON instead of a table");
        status->callback([]{ select(Command::Status); });

        auto* recommend = app.add_subcommand("recommend", "Print the model tier chosen for a Bloom level");
        recommend->add_option("level", g_request.level, "Bloom level 1..6")->required();
        recommend->callback([]{ select(Command::Recommend); });

        auto* compact = app.add_subcommand("compact", "Drop old read messages (one mailbox, or every worker and the owner)");
        compact->add_option("worker", g_request.worker, "Mailbox to compact");
        compact->callback([]{ select(Command::Compact); });
    });
}

CommandRequest get_request() {
    std::lock_guard<std::mutex> lk(g_cmd_opts_mtx);
    CommandRequest r = g_request;
    r.task.bloom_level = g_bloom;
    return r;
}

} // namespace command_opts

// Static auto-registration object
namespace {
    struct CommandOptsAutoReg {
        CommandOptsAutoReg() { command_opts::register_options(); }
    } command_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}

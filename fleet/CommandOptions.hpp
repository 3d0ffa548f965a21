// CommandOptions.hpp - taskfleet subcommands and their arguments
#pragma once

#include "registry/Task.hpp"

#include <optional>
#include <string>
#include <vector>

namespace command_opts {

enum class Command { None, Run, Hook, Bridge, Assign, Complete, Redo, Send, Status, Recommend, Compact };

/** \brief The subcommand chosen on the command line and its arguments. */
struct CommandRequest {
    Command command = Command::None;
    std::string worker;                 ///< assign, complete, redo, send, hook, compact
    bool once = false;                  ///< run: single tick then exit
    std::string ack_out;                ///< bridge: acknowledgment file (stdout when empty)
    TaskFleet::Registry::Task task;     ///< assign, redo
    std::string summary;                ///< complete
    std::string from;                   ///< send
    std::string type;                   ///< send
    std::string content;                ///< send
    bool json = false;                  ///< status
    int level = 0;                      ///< recommend
};

void register_options();

CommandRequest get_request();

} // namespace command_opts

// TmuxExecutionContext.hpp - Worker panes inside a tmux server
#pragma once

#include "IExecutionContext.hpp"
#include "logger.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace TaskFleet::Dispatch {

/**
 * \brief IExecutionContext backed by the `tmux` client.
 * \ingroup dispatch_module
 *
 * Worker::context_target is passed verbatim to `-t`. Every call spawns one
 * short-lived tmux client process; its output is read up to kMaxOutputBytes.
 * A client still running after the call timeout is killed, so a wedged tmux
 * server costs the dispatcher at most that long per call.
 */
class TmuxExecutionContext : public IExecutionContext {
public:
    static constexpr std::size_t kMaxOutputBytes = 256 * 1024;
    static constexpr std::chrono::milliseconds kDefaultCallTimeout{2000};

    explicit TmuxExecutionContext(std::shared_ptr<Logger> logger,
                                  std::string tmux_program = "tmux",
                                  std::chrono::milliseconds call_timeout = kDefaultCallTimeout);

    std::optional<std::string> capture_tail(const Worker& worker, std::size_t lines) override;
    std::error_code send_control(const Worker& worker, const std::string& command) override;

private:
    /**
     * \brief Run tmux with \p args, collecting stdout into \p output.
     * \return Exit status of the child, or -1 if it could not be started,
     *         was killed on timeout, or did not exit normally.
     */
    int run(const std::vector<std::string>& args, std::string* output);

    std::shared_ptr<Logger> logger_;
    std::string program_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace TaskFleet::Dispatch

#include "TmuxExecutionContext.hpp"
#include "FleetError.hpp"
#include "state/ActivityClassifier.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace TaskFleet::Dispatch {

namespace {
constexpr auto kExitPollInterval = std::chrono::milliseconds(5);
}

TmuxExecutionContext::TmuxExecutionContext(std::shared_ptr<Logger> logger, std::string tmux_program,
                                           std::chrono::milliseconds call_timeout)
    : logger_(std::move(logger)), program_(std::move(tmux_program)), call_timeout_(call_timeout) {
    if (!logger_) throw std::invalid_argument("TmuxExecutionContext requires a logger");
}

int TmuxExecutionContext::run(const std::vector<std::string>& args, std::string* output) {
    int fds[2];
    if (pipe(fds) != 0) {
        logger_->error("[Tmux] pipe failed: " + std::string(std::strerror(errno)));
        return -1;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addclose(&actions, fds[0]);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, fds[1]);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // argv must stay alive for the duration of the spawn call
    std::vector<std::string> stable_args;
    stable_args.push_back(program_);
    stable_args.insert(stable_args.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : stable_args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(fds[1]);
    if (rc != 0) {
        close(fds[0]);
        logger_->warning("[Tmux] posix_spawnp " + program_ + " failed: " + std::string(std::strerror(rc)));
        return -1;
    }

    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + call_timeout_;
    bool timed_out = false;

    char buffer[4096];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR) continue;
        if (ready < 0) break;
        if (ready == 0) {
            timed_out = true;
            break;
        }
        ssize_t n = read(fds[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        // Keep draining past the cap so the child never blocks on a full pipe.
        if (output && output->size() < kMaxOutputBytes) {
            output->append(buffer, std::min<std::size_t>(static_cast<std::size_t>(n), kMaxOutputBytes - output->size()));
        }
    }
    close(fds[0]);

    // Output closed; the client still gets only what is left of the deadline to exit.
    int status = 0;
    while (!timed_out) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        if (done < 0 && errno != EINTR) return -1;
        if (Clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }

    logger_->warning("[Tmux] " + program_ + " " + (args.empty() ? std::string{} : args.front()) +
                     " did not finish within " + std::to_string(call_timeout_.count()) + " ms; killed");
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
    return -1;
}

std::optional<std::string> TmuxExecutionContext::capture_tail(const Worker& worker, std::size_t lines) {
    std::string output;
    int status = run({"capture-pane", "-p", "-t", worker.context_target}, &output);
    if (status != 0) {
        logger_->debug("[Tmux] capture-pane for " + worker.id + " exited with " + std::to_string(status));
        return std::nullopt;
    }

    std::string tail;
    for (const auto& line : State::ActivityClassifier::tail_window(output, lines)) {
        tail += line;
        tail += '\n';
    }
    return tail;
}

std::error_code TmuxExecutionContext::send_control(const Worker& worker, const std::string& command) {
    int status = run({"send-keys", "-t", worker.context_target, command, "Enter"}, nullptr);
    if (status != 0) {
        logger_->warning("[Tmux] send-keys '" + command + "' to " + worker.id + " failed (status " +
                         std::to_string(status) + ")");
        return FleetErrc::ContextUnavailable;
    }
    logger_->debug("[Tmux] sent '" + command + "' to " + worker.id);
    return {};
}

} // namespace TaskFleet::Dispatch

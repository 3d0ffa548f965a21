// Worker.hpp - Roster entry for one fleet worker
#pragma once

#include "state/CliFamily.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

class Logger;

namespace TaskFleet::Dispatch {

/**
 * \brief Whether the worker's current turn end was already held back once.
 *
 * The turn-completion hook blocks a turn end at most once in a row; the
 * follow-up turn end always goes through.
 */
enum class TurnDeferral {
    NotDeferred,
    DeferredOnce
};

/**
 * \brief One provisioned worker. Created from configuration, never destroyed here.
 */
struct Worker {
    std::string id;
    std::string model_id;                           ///< Current capability tier; changed by model switches.
    State::CliFamily family = State::CliFamily::Claude;
    std::string context_target;                     ///< Opaque to the core; a tmux pane target for the tmux backend.
    TurnDeferral deferral = TurnDeferral::NotDeferred;
};

/**
 * \brief Read the `workers` array of the config.
 *
 * Entries look like `{"id": "w1", "model": "sonnet", "cli": "claude", "target": "fleet:agents.1"}`.
 * Entries without an id, with an unknown `cli`, or repeating an earlier id are
 * skipped with a warning. A missing `target` defaults to the worker id.
 */
std::vector<Worker> workers_from_json(const nlohmann::json& root, Logger* logger = nullptr);

} // namespace TaskFleet::Dispatch

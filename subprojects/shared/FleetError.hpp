/**
 * \file subprojects/shared/FleetError.hpp
 * \brief Error codes reported by the mailbox, registry, routing and dispatch layers.
 * \details All fallible operations return a std::error_code of the `taskfleet`
 *  category. Success is the default-constructed (zero) code.
 */
#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace TaskFleet {

enum class FleetErrc {
    LockTimeout = 1,     ///< Per-resource lock not acquired within the bound; nothing written.
    StillBlocked,        ///< A blocked_by predecessor is not done yet.
    InvalidLevel,        ///< Bloom level outside 1..6.
    NotConfigured,       ///< No capability tiers; routing disabled.
    NoTask,              ///< Worker has no task record.
    InvalidTransition,   ///< Status change not allowed from the current status.
    DuplicateTask,       ///< Task id already present in the registry.
    WorkerBusy,          ///< Worker already holds a non-terminal task.
    LineageMismatch,     ///< redo_of does not name the completed predecessor.
    InvalidKey,          ///< Store key empty or not a plain file name.
    CorruptDocument,     ///< Existing document could not be parsed; left untouched.
    IoFailure,           ///< Temporary write, fsync or rename failed.
    NotFound,            ///< Referenced message or task does not exist.
    UnknownWorker,       ///< Worker id not in the roster.
    ContextUnavailable,  ///< Execution context could not deliver a control command.
    ChannelFailure       ///< External notification channel rejected a send.
};

const std::error_category& fleet_category() noexcept;

inline std::error_code make_error_code(FleetErrc e) noexcept {
    return {static_cast<int>(e), fleet_category()};
}

} // namespace TaskFleet

namespace std {
template <>
struct is_error_code_enum<TaskFleet::FleetErrc> : true_type {};
} // namespace std

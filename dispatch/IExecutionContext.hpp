/**
 * \file dispatch/IExecutionContext.hpp
 * \brief Access to the terminal a worker runs in.
 * \ingroup dispatch_module
 */
#pragma once

#include "Worker.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

namespace TaskFleet::Dispatch {

/**
 * \brief Observation and control of a worker's execution context.
 *
 * Creating the context is someone else's job; implementations only look at it
 * and type into it.
 */
class IExecutionContext {
public:
    virtual ~IExecutionContext() = default;

    /**
     * \brief Last \p lines lines of the worker's visible output.
     * \return nullopt when the context cannot be read at all.
     */
    virtual std::optional<std::string> capture_tail(const Worker& worker, std::size_t lines) = 0;

    /**
     * \brief Type \p command into the worker's input and submit it.
     * \return FleetErrc::ContextUnavailable when it could not be delivered.
     */
    virtual std::error_code send_control(const Worker& worker, const std::string& command) = 0;
};

} // namespace TaskFleet::Dispatch

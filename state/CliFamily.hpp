/**
 * \file state/CliFamily.hpp
 * \brief Per-program traits of the interactive CLIs a worker can drive.
 * \ingroup state_module
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TaskFleet::State {

/**
 * \brief CLI program family a worker runs.
 *
 * Determines which in-band control commands the worker understands and which
 * prompt markers mean "ready for input".
 */
enum class CliFamily {
    Claude,
    Codex
};

/**
 * \brief Static traits of one CLI family.
 */
struct CliFamilyProfile {
    CliFamily family;
    std::string name;                        ///< Config spelling, e.g. "claude".
    std::vector<std::string> idle_patterns;  ///< ECMAScript patterns, matched against single lines.
    std::string reset_command;               ///< Clears the conversation so the task file is re-read.
};

/** \brief Every known family, in idle-rule priority order. */
const std::vector<CliFamilyProfile>& cli_family_profiles();

/** \brief Profile for a family; every enumerator has one. */
const CliFamilyProfile& profile_for(CliFamily family);

/** \brief Parse a config spelling ("claude", "codex"); case-insensitive. */
std::optional<CliFamily> parse_cli_family(std::string_view name);

std::string to_string(CliFamily family);

} // namespace TaskFleet::State

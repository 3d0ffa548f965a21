#include "CliFamily.hpp"

#include <algorithm>
#include <cctype>

namespace TaskFleet::State {

const std::vector<CliFamilyProfile>& cli_family_profiles() {
    // Codex prints its shortcut hint and context gauge under an idle prompt;
    // Claude leaves a bare prompt glyph on its own line.
    static const std::vector<CliFamilyProfile> profiles = {
        {CliFamily::Codex, "codex", {R"(\? for shortcuts)", R"(context left)"}, "/new"},
        {CliFamily::Claude, "claude", {R"(^(❯|›)\s*$)"}, "/clear"},
    };
    return profiles;
}

const CliFamilyProfile& profile_for(CliFamily family) {
    const auto& profiles = cli_family_profiles();
    auto it = std::find_if(profiles.begin(), profiles.end(),
                           [family](const CliFamilyProfile& p) { return p.family == family; });
    return it != profiles.end() ? *it : profiles.front();
}

std::optional<CliFamily> parse_cli_family(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& profile : cli_family_profiles()) {
        if (profile.name == lowered) return profile.family;
    }
    return std::nullopt;
}

std::string to_string(CliFamily family) {
    return profile_for(family).name;
}

} // namespace TaskFleet::State

#include "ActivityClassifier.hpp"
#include "CliFamily.hpp"

#include <algorithm>

namespace TaskFleet::State {

namespace {

// Only line breaks count as blank; a line of spaces is still pane content.
bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](char c) { return c == '\r'; });
}

std::vector<std::string> window_of(std::vector<std::string> lines, std::size_t count) {
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }
    if (lines.size() > count) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    }
    return lines;
}

} // namespace

std::string to_string(ActivityState state) {
    switch (state) {
        case ActivityState::Busy:   return "busy";
        case ActivityState::Idle:   return "idle";
        case ActivityState::Absent: return "absent";
    }
    return "unknown";
}

ActivityClassifier::ActivityClassifier()
    : rules_(default_rules()) {}

ActivityClassifier::ActivityClassifier(std::vector<ClassifierRule> rules)
    : rules_(std::move(rules)) {}

std::vector<ClassifierRule> ActivityClassifier::default_rules() {
    std::vector<ClassifierRule> rules;

    for (const auto& profile : cli_family_profiles()) {
        for (const auto& pattern : profile.idle_patterns) {
            rules.push_back({profile.name + "-idle-prompt",
                             std::regex(pattern, std::regex::ECMAScript),
                             ActivityState::Idle});
        }
    }

    const auto icase = std::regex::ECMAScript | std::regex::icase;
    rules.push_back({"interrupt-hint", std::regex("esc to interrupt", icase), ActivityState::Busy});
    rules.push_back({"background-terminal", std::regex("background terminal running", icase), ActivityState::Busy});
    rules.push_back({"activity-word",
                     std::regex("(Working|Thinking|Planning|Sending|task is in progress|"
                                "Compacting conversation|thought for)", icase),
                     ActivityState::Busy});
    // Localized spinner labels carry no case; matched byte-exact.
    rules.push_back({"activity-word-localized",
                     std::regex("(思考中|考え中|計画中|送信中|処理中|実行中)", std::regex::ECMAScript),
                     ActivityState::Busy});
    return rules;
}

std::vector<std::string> ActivityClassifier::tail_window(std::string_view capture, std::size_t count) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= capture.size()) {
        std::size_t end = capture.find('\n', start);
        if (end == std::string_view::npos) end = capture.size();
        std::string line(capture.substr(start, end - start));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return window_of(std::move(lines), count);
}

ActivityState ActivityClassifier::classify(const std::vector<std::string>& lines) const {
    const auto window = window_of(lines, kTailLines);
    if (window.empty()) {
        return ActivityState::Absent;
    }

    for (const auto& rule : rules_) {
        for (const auto& line : window) {
            if (std::regex_search(line, rule.pattern)) {
                return rule.outcome;
            }
        }
    }
    return ActivityState::Idle;
}

ActivityState ActivityClassifier::classify_capture(std::string_view capture) const {
    return classify(tail_window(capture, kTailLines));
}

ActivityState classify(const std::vector<std::string>& tail) {
    static const ActivityClassifier classifier;
    return classifier.classify(tail);
}

} // namespace TaskFleet::State

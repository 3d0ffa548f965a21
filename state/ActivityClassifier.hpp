/**
 * \file state/ActivityClassifier.hpp
 * \brief Busy/idle/absent inference from the tail of a worker's terminal output.
 * \ingroup state_module
 */
#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace TaskFleet::State {

/**
 * \defgroup state_module State Inference Module
 * \brief Classifies worker activity without any structured signal from the worker.
 */

enum class ActivityState {
    Busy,
    Idle,
    Absent
};

/** \brief "busy", "idle" or "absent". */
std::string to_string(ActivityState state);

/**
 * \brief One entry of the classification table.
 *
 * A rule fires when its pattern matches any single line of the tail window.
 */
struct ClassifierRule {
    std::string name;
    std::regex pattern;
    ActivityState outcome;
};

/**
 * \brief Ordered first-match-wins rule table over the last lines of output.
 * \ingroup state_module
 *
 * The default table checks idle prompts before busy markers. Some programs
 * leave a stale "esc to interrupt" line directly above a fresh idle prompt;
 * checking busy first would report such a worker busy forever.
 *
 * Only the last kTailLines lines are inspected. Busy markers linger in
 * scroll-back long after the turn ended.
 */
class ActivityClassifier {
public:
    static constexpr std::size_t kTailLines = 5;

    /** \brief Classifier with default_rules(). */
    ActivityClassifier();

    explicit ActivityClassifier(std::vector<ClassifierRule> rules);

    /**
     * \brief Classify a list of output lines (oldest first).
     *
     * Trailing blank lines are dropped before the window is taken. A window with
     * no visible characters is Absent. If no rule matches the result is Idle.
     */
    ActivityState classify(const std::vector<std::string>& lines) const;

    /** \brief Classify raw captured text (newline separated). */
    ActivityState classify_capture(std::string_view capture) const;

    const std::vector<ClassifierRule>& rules() const { return rules_; }

    /**
     * \brief Idle prompts of every CLI family, then busy markers.
     */
    static std::vector<ClassifierRule> default_rules();

    /**
     * \brief Split text into lines and keep the last \p count non-trailing-blank lines.
     */
    static std::vector<std::string> tail_window(std::string_view capture, std::size_t count = kTailLines);

private:
    std::vector<ClassifierRule> rules_;
};

/** \brief Classify with the shared default table. */
ActivityState classify(const std::vector<std::string>& tail);

} // namespace TaskFleet::State

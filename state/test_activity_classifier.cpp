//
// Activity classifier tests
//
// Covers the rule order (idle prompts before busy markers), the five-line
// window, the absent case, and the CLI family table.
//

#include "state/ActivityClassifier.hpp"
#include "state/CliFamily.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace TaskFleet::State;

void test_busy_markers() {
    std::cout << "=== Test: busy markers ===" << std::endl;

    assert(classify({"Working (12s • esc to interrupt)"}) == ActivityState::Busy);
    assert(classify({"some output", "ESC TO INTERRUPT"}) == ActivityState::Busy);
    assert(classify({"1 background terminal running"}) == ActivityState::Busy);
    assert(classify({"✻ Thinking…"}) == ActivityState::Busy);
    assert(classify({"Compacting conversation"}) == ActivityState::Busy);
    assert(classify({"thought for 4s"}) == ActivityState::Busy);
    assert(classify({"・思考中"}) == ActivityState::Busy);
    assert(classify({"実行中..."}) == ActivityState::Busy);

    std::cout << "busy markers OK" << std::endl << std::endl;
}

void test_idle_prompts() {
    std::cout << "=== Test: idle prompts ===" << std::endl;

    assert(classify({"? for shortcuts", "100% context left"}) == ActivityState::Idle);
    assert(classify({"❯"}) == ActivityState::Idle);
    assert(classify({"›  "}) == ActivityState::Idle);
    // No marker at all defaults to idle.
    assert(classify({"plain shell output"}) == ActivityState::Idle);

    std::cout << "idle prompts OK" << std::endl << std::endl;
}

void test_idle_wins_over_stale_busy() {
    std::cout << "=== Test: idle prompt beats stale busy marker ===" << std::endl;

    std::vector<std::string> lines = {
        "Working (3m • esc to interrupt)",
        "done.",
        "? for shortcuts"
    };
    assert(classify(lines) == ActivityState::Idle);

    std::cout << "rule priority OK" << std::endl << std::endl;
}

void test_window_excludes_scrollback() {
    std::cout << "=== Test: only the last five lines count ===" << std::endl;

    std::vector<std::string> lines = {
        "Thinking…",  // six lines up: outside the window
        "a", "b", "c", "d", "e"
    };
    assert(classify(lines) == ActivityState::Idle);

    lines.push_back("");
    lines.push_back("   ");
    assert(classify(lines) == ActivityState::Idle);

    // Trailing blank lines are dropped before the window is taken.
    assert(ActivityClassifier::tail_window("x\nThinking\n1\n2\n3\n\n\n").size() == 5);
    assert(ActivityClassifier().classify_capture("Thinking\n1\n2\n3\n4\n\n\n") == ActivityState::Busy);
    assert(ActivityClassifier().classify_capture("Thinking\n1\n2\n3\n4\n5\n") == ActivityState::Idle);

    std::cout << "window OK" << std::endl << std::endl;
}

void test_absent() {
    std::cout << "=== Test: absent ===" << std::endl;

    assert(classify({}) == ActivityState::Absent);
    assert(classify({"", "", ""}) == ActivityState::Absent);
    assert(ActivityClassifier().classify_capture("") == ActivityState::Absent);
    assert(ActivityClassifier().classify_capture("\n\n\r\n") == ActivityState::Absent);

    // Whitespace is content: the pane is there, it just shows nothing busy.
    assert(classify({"   "}) == ActivityState::Idle);
    assert(ActivityClassifier().classify_capture("  \t \n\n") == ActivityState::Idle);
    assert(ActivityClassifier::tail_window("a\n \n\r\n\n").size() == 2);
    assert(to_string(ActivityState::Absent) == "absent");

    std::cout << "absent OK" << std::endl << std::endl;
}

void test_custom_rules() {
    std::cout << "=== Test: custom rule table ===" << std::endl;

    std::vector<ClassifierRule> rules;
    rules.push_back({"spinner", std::regex("spinning"), ActivityState::Busy});
    ActivityClassifier classifier(std::move(rules));
    assert(classifier.classify({"spinning"}) == ActivityState::Busy);
    // Default markers are not part of this table.
    assert(classifier.classify({"Thinking"}) == ActivityState::Idle);

    std::cout << "custom rules OK" << std::endl << std::endl;
}

void test_cli_families() {
    std::cout << "=== Test: CLI family table ===" << std::endl;

    assert(profile_for(CliFamily::Claude).reset_command == "/clear");
    assert(profile_for(CliFamily::Codex).reset_command == "/new");
    assert(parse_cli_family("CODEX") == CliFamily::Codex);
    assert(parse_cli_family("claude") == CliFamily::Claude);
    assert(!parse_cli_family("gemini"));
    assert(to_string(CliFamily::Codex) == "codex");

    std::cout << "CLI families OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Activity Classifier Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_busy_markers();
    test_idle_prompts();
    test_idle_wins_over_stale_busy();
    test_window_excludes_scrollback();
    test_absent();
    test_custom_rules();
    test_cli_families();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}

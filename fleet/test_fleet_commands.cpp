//
// Fleet command tests
//
// Runs FleetApp subcommands against a temporary state directory and an
// execution context that never sees a pane.
//

#include "FleetCommands.hpp"
#include "FleetError.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace TaskFleet;
using command_opts::Command;
using command_opts::CommandRequest;
namespace fs = std::filesystem;

class PanelessContext : public Dispatch::IExecutionContext {
public:
    std::optional<std::string> capture_tail(const Dispatch::Worker&, std::size_t) override { return std::nullopt; }
    std::error_code send_control(const Dispatch::Worker&, const std::string&) override {
        return FleetErrc::ContextUnavailable;
    }
};

static fs::path make_temp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "taskfleet_fleet_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = ::mkdtemp(buf.data());
    assert(created != nullptr);
    return fs::path(created);
}

static std::vector<Dispatch::Worker> one_worker() {
    Dispatch::Worker w;
    w.id = "w1";
    w.model_id = "spark";
    w.family = State::CliFamily::Codex;
    w.context_target = "fleet:agents.1";
    return {w};
}

static std::optional<Routing::CapabilityConfig> tiers(const std::string& mode) {
    return Routing::CapabilityConfig::from_json(nlohmann::ordered_json::parse(R"({
        "capability_tiers": {
            "spark":  {"max_bloom": 3, "cost_group": "chatgpt_pro"},
            "codex":  {"max_bloom": 4, "cost_group": "chatgpt_pro"},
            "sonnet": {"max_bloom": 5, "cost_group": "claude_max"},
            "opus":   {"max_bloom": 6, "cost_group": "claude_max"}
        },
        "routing": {"mode": ")" + mode + R"("}
    })"));
}

struct AppFixture {
    fs::path dir = make_temp_dir();
    std::shared_ptr<Logger> logger = std::make_shared<Logger>("test");
    std::shared_ptr<VectorSink> sink = std::make_shared<VectorSink>();
    std::unique_ptr<FleetApp> app;
    std::atomic<bool> stop{false};

    explicit AppFixture(std::optional<Routing::CapabilityConfig> capability, std::size_t keep_read = 20) {
        logger->add_sink(sink);
        FleetSettings settings;
        settings.state_dir = dir.string();
        settings.keep_read = keep_read;
        settings.lock_timeout = std::chrono::milliseconds(200);
        app = std::make_unique<FleetApp>(settings, one_worker(), std::move(capability), logger,
                                         std::make_shared<PanelessContext>());
    }
    ~AppFixture() { fs::remove_all(dir); }

    int run(const CommandRequest& request, std::string* printed = nullptr) {
        std::istringstream in;
        std::ostringstream out;
        int rc = app->execute(request, in, out, stop);
        if (printed) *printed = out.str();
        return rc;
    }
};

static CommandRequest recommend_level(int level) {
    CommandRequest r;
    r.command = Command::Recommend;
    r.level = level;
    return r;
}

void test_recommend_modes() {
    std::cout << "=== Test: recommend follows the routing mode ===" << std::endl;
    std::string printed;

    {
        AppFixture f(std::nullopt);
        assert(f.run(recommend_level(5), &printed) == 0);
        assert(printed.find("routing disabled") == 0);
    }
    {
        AppFixture f(tiers("auto"));
        assert(f.run(recommend_level(5), &printed) == 0);
        assert(printed == "sonnet\n");
        assert(f.run(recommend_level(9), &printed) == 2);
        assert(printed.empty());
    }
    {
        AppFixture f(tiers("manual"));
        assert(f.run(recommend_level(4), &printed) == 0);
        assert(printed == "codex\n");
    }
    {
        AppFixture f(tiers("off"));
        assert(f.run(recommend_level(5), &printed) == 0);
        assert(printed.find("routing off") == 0);
        assert(printed.find("sonnet") == std::string::npos);
    }

    std::cout << "recommend OK" << std::endl << std::endl;
}

void test_compact_subcommand() {
    std::cout << "=== Test: compact one mailbox and all of them ===" << std::endl;
    AppFixture f(std::nullopt, 1);

    CommandRequest send;
    send.command = Command::Send;
    send.from = "owner";
    send.type = "info";
    for (const std::string who : {"w1", "owner"}) {
        send.worker = who;
        for (int i = 0; i < 3; ++i) {
            send.content = who + " note " + std::to_string(i);
            assert(f.run(send) == 0);
        }
    }
    assert(!f.app->mailboxes().mark_all_read("w1"));
    assert(!f.app->mailboxes().mark_all_read("owner"));
    send.worker = "w1";
    send.content = "unread one";
    assert(f.run(send) == 0);

    CommandRequest compact;
    compact.command = Command::Compact;
    compact.worker = "w1";
    assert(f.run(compact) == 0);
    auto left = f.app->mailboxes().messages("w1");
    assert(left.size() == 2);
    assert(left[0].content == "w1 note 2" && left[0].read);
    assert(left[1].content == "unread one" && !left[1].read);
    assert(f.app->mailboxes().messages("owner").size() == 3);

    compact.worker.clear();
    assert(f.run(compact) == 0);
    assert(f.app->mailboxes().messages("owner").size() == 1);
    assert(f.app->mailboxes().messages("w1").size() == 2);
    assert(f.app->mailboxes().unread_count("w1") == 1);

    std::cout << "compact OK" << std::endl << std::endl;
}

void test_no_subcommand() {
    std::cout << "=== Test: no subcommand selected ===" << std::endl;
    AppFixture f(std::nullopt);
    assert(f.run(CommandRequest{}) == 2);
    assert(f.sink->contains("no subcommand selected"));
    std::cout << "no subcommand OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Fleet Command Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_recommend_modes();
    test_compact_subcommand();
    test_no_subcommand();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}

//
// Task registry tests
//

#include "registry/TaskRegistry.hpp"
#include "store/FileDocumentStore.hpp"
#include "store/MemoryDocumentStore.hpp"
#include "FleetError.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace TaskFleet;
using namespace TaskFleet::Registry;
namespace fs = std::filesystem;

static Task make_task(const std::string& id, std::vector<std::string> blocked_by = {}) {
    Task t;
    t.task_id = id;
    t.parent_id = "cmd_001";
    t.type = "implement";
    t.description = "work item " + id;
    t.blocked_by = std::move(blocked_by);
    return t;
}

static std::shared_ptr<TaskRegistry> memory_registry() {
    auto logger = std::make_shared<Logger>("test");
    logger->add_sink(std::make_shared<VectorSink>());
    return std::make_shared<TaskRegistry>(std::make_shared<Store::MemoryDocumentStore>(), logger);
}

void test_initial_status() {
    std::cout << "=== Test: initial status ===" << std::endl;
    auto reg = memory_registry();

    assert(!reg->get("w1"));
    auto t = make_task("A");
    t.status = TaskStatus::Done;  // ignored: registration normalises the status
    assert(!reg->set("w1", t));
    assert(reg->get("w1")->status == TaskStatus::Assigned);
    assert(!reg->get("w1")->timestamp.empty());

    assert(!reg->set("w2", make_task("B", {"A"})));
    assert(reg->get("w2")->status == TaskStatus::Blocked);

    auto ids = reg->worker_ids();
    assert(ids.size() == 2 && ids[0] == "w1" && ids[1] == "w2");

    std::cout << "initial status OK" << std::endl << std::endl;
}

void test_dependency_gating_across_workers() {
    std::cout << "=== Test: blocked until every predecessor is done ===" << std::endl;
    auto reg = memory_registry();

    assert(!reg->set("w1", make_task("A")));
    assert(!reg->set("w2", make_task("B")));
    assert(!reg->set("w3", make_task("C", {"A", "B"})));

    assert(reg->transition("w3", TaskStatus::Assigned) == FleetErrc::StillBlocked);
    assert(reg->unmet_dependencies(*reg->get("w3")) == std::vector<std::string>({"A", "B"}));

    assert(!reg->transition("w1", TaskStatus::Done));
    assert(reg->transition("w3", TaskStatus::Assigned) == FleetErrc::StillBlocked);
    assert(reg->unmet_dependencies(*reg->get("w3")) == std::vector<std::string>({"B"}));

    assert(!reg->transition("w2", TaskStatus::Done));
    assert(!reg->transition("w3", TaskStatus::Assigned));
    assert(reg->get("w3")->status == TaskStatus::Assigned);

    // Unknown predecessors never resolve.
    assert(!reg->set("w4", make_task("D", {"ghost"})));
    assert(reg->transition("w4", TaskStatus::Assigned) == FleetErrc::StillBlocked);

    std::cout << "dependency gating OK" << std::endl << std::endl;
}

void test_invalid_transitions() {
    std::cout << "=== Test: invalid transitions ===" << std::endl;
    auto reg = memory_registry();

    assert(reg->transition("nobody", TaskStatus::Done) == FleetErrc::NoTask);

    assert(!reg->set("w1", make_task("A")));
    assert(reg->transition("w1", TaskStatus::Blocked) == FleetErrc::InvalidTransition);
    assert(reg->transition("w1", TaskStatus::Assigned) == FleetErrc::InvalidTransition);
    assert(!reg->transition("w1", TaskStatus::Done));
    assert(reg->transition("w1", TaskStatus::Assigned) == FleetErrc::InvalidTransition);
    assert(reg->transition("w1", TaskStatus::Done) == FleetErrc::InvalidTransition);

    assert(!reg->set("w2", make_task("B", {"X"})));
    assert(reg->transition("w2", TaskStatus::Done) == FleetErrc::InvalidTransition);

    std::cout << "invalid transitions OK" << std::endl << std::endl;
}

void test_set_rejections() {
    std::cout << "=== Test: set rejections ===" << std::endl;
    auto reg = memory_registry();

    assert(!reg->set("w1", make_task("A")));
    assert(reg->set("w1", make_task("B")) == FleetErrc::WorkerBusy);
    assert(reg->set("w2", make_task("A")) == FleetErrc::DuplicateTask);
    assert(reg->set("w2", make_task("")) == FleetErrc::InvalidKey);
    assert(reg->set("w2", make_task("S", {"S"})) == FleetErrc::InvalidTransition);

    auto high = make_task("H");
    high.bloom_level = 7;
    assert(reg->set("w2", high) == FleetErrc::InvalidLevel);
    high.bloom_level = 0;
    assert(reg->set("w2", high) == FleetErrc::InvalidLevel);
    high.bloom_level = 6;
    assert(!reg->set("w2", high));
    assert(reg->get("w2")->bloom_level == 6);

    auto lineage_bad = make_task("R");
    lineage_bad.redo_of = "A";  // A exists but is not done
    assert(reg->set("w3", lineage_bad) == FleetErrc::LineageMismatch);
    lineage_bad.redo_of = "missing";
    assert(reg->set("w3", lineage_bad) == FleetErrc::LineageMismatch);

    // Once done, the worker accepts a new task and A moves to history.
    assert(!reg->transition("w1", TaskStatus::Done));
    auto successor = make_task("A2");
    successor.redo_of = "A";
    assert(!reg->set("w1", successor));
    assert(reg->history("w1").size() == 1 && reg->history("w1")[0].task_id == "A");
    assert(reg->is_done("A"));
    assert(!reg->is_done("A2"));
    assert(reg->find("A")->status == TaskStatus::Done);
    assert(!reg->find("nope"));

    std::cout << "set rejections OK" << std::endl << std::endl;
}

void test_redo_chain() {
    std::cout << "=== Test: redo twice keeps A <- B <- C ===" << std::endl;
    auto reg = memory_registry();

    assert(reg->redo("w1", make_task("B")) == FleetErrc::NoTask);
    assert(!reg->set("w1", make_task("A")));
    // Current task must be done first.
    assert(reg->redo("w1", make_task("B")) == FleetErrc::InvalidTransition);
    assert(!reg->transition("w1", TaskStatus::Done));

    assert(!reg->redo("w1", make_task("B")));
    assert(reg->get("w1")->task_id == "B");
    assert(reg->get("w1")->redo_of == std::optional<std::string>("A"));
    assert(reg->get("w1")->status == TaskStatus::Assigned);

    assert(!reg->transition("w1", TaskStatus::Done));
    auto wrong = make_task("C");
    wrong.redo_of = "A";  // must name the task being replaced
    assert(reg->redo("w1", wrong) == FleetErrc::LineageMismatch);
    assert(reg->get("w1")->task_id == "B");

    auto c = make_task("C");
    c.redo_of = "B";
    assert(!reg->redo("w1", c));
    assert(reg->lineage("C") == std::vector<std::string>({"C", "B", "A"}));
    assert(reg->lineage("B") == std::vector<std::string>({"B", "A"}));
    assert(reg->lineage("A") == std::vector<std::string>({"A"}));
    assert(reg->lineage("nothing").empty());

    auto hist = reg->history("w1");
    assert(hist.size() == 2 && hist[0].task_id == "A" && hist[1].task_id == "B");
    // Redo ids share the registry-wide namespace.
    assert(!reg->transition("w1", TaskStatus::Done));
    assert(reg->redo("w1", make_task("A")) == FleetErrc::DuplicateTask);

    std::cout << "redo chain OK" << std::endl << std::endl;
}

void test_file_persistence() {
    std::cout << "=== Test: records survive a new registry instance ===" << std::endl;
    std::string tmpl = (fs::temp_directory_path() / "taskfleet_registry_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = ::mkdtemp(buf.data());
    assert(created != nullptr);
    fs::path dir(created);

    {
        TaskRegistry reg(std::make_shared<Store::FileDocumentStore>(dir), nullptr);
        auto t = make_task("A");
        t.bloom_level = 3;
        assert(!reg.set("w1", t));
        assert(!reg.transition("w1", TaskStatus::Done));
        assert(!reg.redo("w1", make_task("B")));
    }

    auto store = std::make_shared<Store::FileDocumentStore>(dir);
    auto doc = store->load("w1");
    assert(doc && doc->contains("task") && doc->contains("history"));
    assert((*doc)["task"]["redo_of"] == "A");
    assert((*doc)["history"][0]["bloom_level"] == 3);
    assert((*doc)["history"][0]["status"] == "done");

    TaskRegistry reg(store, nullptr);
    assert(reg.get("w1")->task_id == "B");
    assert(reg.lineage("B") == std::vector<std::string>({"B", "A"}));

    fs::remove_all(dir);
    std::cout << "file persistence OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Task Registry Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_initial_status();
    test_dependency_gating_across_workers();
    test_invalid_transitions();
    test_set_rejections();
    test_redo_chain();
    test_file_persistence();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}

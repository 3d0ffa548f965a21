//
// Mailbox store tests
//

#include "mailbox/MailboxStore.hpp"
#include "store/FileDocumentStore.hpp"
#include "store/FileLock.hpp"
#include "store/MemoryDocumentStore.hpp"
#include "FleetError.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TaskFleet;
using namespace TaskFleet::Mailbox;
namespace fs = std::filesystem;

static fs::path make_temp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "taskfleet_mailbox_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* dir = ::mkdtemp(buf.data());
    assert(dir != nullptr);
    return fs::path(dir);
}

static Message make_message(const std::string& content, const std::string& type = message_types::Info) {
    Message m;
    m.from = "owner";
    m.type = type;
    m.content = content;
    return m;
}

static std::shared_ptr<Logger> quiet_logger() {
    auto logger = std::make_shared<Logger>("test");
    logger->add_sink(std::make_shared<VectorSink>());
    return logger;
}

void test_unread_counting() {
    std::cout << "=== Test: append N, mark all read, append one ===" << std::endl;
    MailboxStore box(std::make_shared<Store::MemoryDocumentStore>(), quiet_logger());

    assert(box.unread_count("w1") == 0);
    constexpr int kN = 7;
    for (int i = 0; i < kN; ++i) {
        assert(!box.append("w1", make_message("m" + std::to_string(i))));
    }
    assert(box.unread_count("w1") == kN);

    assert(!box.mark_all_read("w1"));
    assert(box.unread_count("w1") == 0);
    assert(box.messages("w1").size() == kN);

    assert(!box.append("w1", make_message("one more")));
    assert(box.unread_count("w1") == 1);
    assert(box.unread("w1").front().content == "one more");

    std::cout << "unread counting OK" << std::endl << std::endl;
}

void test_order_ids_and_timestamps() {
    std::cout << "=== Test: insertion order, generated ids, timestamps ===" << std::endl;
    MailboxStore box(std::make_shared<Store::MemoryDocumentStore>(), quiet_logger());

    std::string first_id;
    assert(!box.append("w1", make_message("first"), &first_id));
    Message preset = make_message("second");
    preset.id = "fixed";
    preset.read = true;  // forced back to unread
    assert(!box.append("w1", preset));
    std::string collided;
    Message dup = make_message("third");
    dup.id = "fixed";
    assert(!box.append("w1", dup, &collided));

    auto all = box.messages("w1");
    assert(all.size() == 3);
    assert(all[0].content == "first" && all[1].content == "second" && all[2].content == "third");
    assert(all[0].id == first_id);
    assert(first_id.rfind("msg_", 0) == 0 && first_id.size() == std::string("msg_20260101_120000_0123abcd").size());
    assert(all[1].id == "fixed" && !all[1].read);
    assert(collided != "fixed" && all[2].id == collided);
    for (const auto& m : all) {
        assert(m.timestamp.size() == std::string("2026-01-01T12:00:00").size());
        assert(m.timestamp[10] == 'T');
    }

    std::cout << "order/ids OK" << std::endl << std::endl;
}

void test_mark_read() {
    std::cout << "=== Test: mark_read ===" << std::endl;
    MailboxStore box(std::make_shared<Store::MemoryDocumentStore>(), quiet_logger());

    // Absent mailbox.
    assert(!box.mark_all_read("nobody"));
    assert(box.mark_read("nobody", "x") == FleetErrc::NotFound);

    std::string a, b;
    assert(!box.append("w1", make_message("a"), &a));
    assert(!box.append("w1", make_message("b"), &b));
    assert(!box.mark_read("w1", a));
    assert(!box.mark_read("w1", a));  // already read: no-op
    assert(box.unread_count("w1") == 1);
    assert(box.unread("w1").front().id == b);
    assert(box.mark_read("w1", "unknown") == FleetErrc::NotFound);
    assert(box.unread_count("w1") == 1);

    std::cout << "mark_read OK" << std::endl << std::endl;
}

void test_lock_timeout_leaves_mailbox_untouched() {
    std::cout << "=== Test: lock timeout ===" << std::endl;
    auto dir = make_temp_dir();
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    logger->add_sink(sink);
    auto store = std::make_shared<Store::FileDocumentStore>(dir, logger);
    MailboxStore box(store, logger, std::chrono::milliseconds(50));
    assert(box.lock_timeout() == std::chrono::milliseconds(50));

    assert(!box.append("w1", make_message("before")));
    std::ifstream before_in(store->document_path("w1"));
    std::stringstream before;
    before << before_in.rdbuf();

    Store::FileLock holder(store->lock_path("w1"));
    assert(holder.acquire(std::chrono::milliseconds(1000)));
    assert(box.append("w1", make_message("blocked")) == FleetErrc::LockTimeout);
    assert(box.mark_all_read("w1") == FleetErrc::LockTimeout);
    assert(sink->contains("append on w1 failed"));

    std::ifstream after_in(store->document_path("w1"));
    std::stringstream after;
    after << after_in.rdbuf();
    assert(before.str() == after.str());
    assert(box.unread_count("w1") == 1);

    // Reads never wait for the lock.
    assert(box.messages("w1").size() == 1);
    holder.release();
    assert(!box.append("w1", make_message("after")));
    assert(box.unread_count("w1") == 2);

    fs::remove_all(dir);
    std::cout << "lock timeout OK" << std::endl << std::endl;
}

void test_concurrent_appends() {
    std::cout << "=== Test: concurrent appends keep every message ===" << std::endl;
    auto dir = make_temp_dir();
    constexpr int kThreads = 4;
    constexpr int kPerThread = 10;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([dir, t] {
            MailboxStore box(std::make_shared<Store::FileDocumentStore>(dir), nullptr);
            for (int i = 0; i < kPerThread; ++i) {
                auto ec = box.append("shared", make_message("t" + std::to_string(t) + "-" + std::to_string(i)));
                assert(!ec);
            }
        });
    }
    for (auto& th : threads) th.join();

    MailboxStore box(std::make_shared<Store::FileDocumentStore>(dir), nullptr);
    auto all = box.messages("shared");
    assert(all.size() == kThreads * kPerThread);
    std::set<std::string> ids;
    for (const auto& m : all) ids.insert(m.id);
    assert(ids.size() == all.size());

    fs::remove_all(dir);
    std::cout << "concurrent appends OK" << std::endl << std::endl;
}

void test_compact_drops_oldest_read() {
    std::cout << "=== Test: compact keeps unread mail and order ===" << std::endl;
    MailboxStore box(std::make_shared<Store::MemoryDocumentStore>(), quiet_logger());

    std::size_t removed = 99;
    assert(!box.compact("nobody", 0, &removed));
    assert(removed == 0);

    // r0 r1 u2 r3 u4 r5 u6: read and unread interleaved.
    std::vector<std::string> ids(7);
    for (int i = 0; i < 7; ++i) {
        assert(!box.append("w1", make_message("m" + std::to_string(i)), &ids[i]));
    }
    for (int i : {0, 1, 3, 5}) assert(!box.mark_read("w1", ids[i]));
    assert(box.unread_count("w1") == 3);

    // Fewer read messages than the budget: nothing to do.
    assert(!box.compact("w1", 10, &removed));
    assert(removed == 0);
    assert(box.messages("w1").size() == 7);

    assert(!box.compact("w1", 1, &removed));
    assert(removed == 3);
    auto left = box.messages("w1");
    std::vector<std::string> contents;
    for (const auto& m : left) contents.push_back(m.content);
    assert(contents == std::vector<std::string>({"m2", "m4", "m5", "m6"}));
    assert(left[2].read && left[2].id == ids[5]);
    assert(box.unread_count("w1") == 3);

    assert(!box.compact("w1", 0, &removed));
    assert(removed == 1);
    assert(box.messages("w1").size() == 3);
    assert(box.unread_count("w1") == 3);

    // A compacted mailbox keeps accepting mail with fresh ids.
    std::string next;
    assert(!box.append("w1", make_message("m7"), &next));
    assert(next != ids[2] && next != ids[4] && next != ids[6]);
    assert(box.unread("w1").back().content == "m7");

    std::cout << "compact OK" << std::endl << std::endl;
}

void test_compact_respects_lock() {
    std::cout << "=== Test: compact under a held lock ===" << std::endl;
    auto dir = make_temp_dir();
    auto logger = quiet_logger();
    auto store = std::make_shared<Store::FileDocumentStore>(dir, logger);
    MailboxStore box(store, logger, std::chrono::milliseconds(50));

    assert(!box.append("w1", make_message("old")));
    assert(!box.mark_all_read("w1"));

    Store::FileLock holder(store->lock_path("w1"));
    assert(holder.acquire(std::chrono::milliseconds(1000)));
    assert(box.compact("w1", 0) == FleetErrc::LockTimeout);
    assert(box.messages("w1").size() == 1);
    holder.release();

    assert(!box.compact("w1", 0));
    assert(box.messages("w1").empty());

    fs::remove_all(dir);
    std::cout << "compact lock OK" << std::endl << std::endl;
}

void test_corrupt_mailbox_not_rewritten() {
    std::cout << "=== Test: structurally broken mailbox ===" << std::endl;
    auto store = std::make_shared<Store::MemoryDocumentStore>();
    auto seeded = store->update("w1", std::chrono::milliseconds(100), [](nlohmann::json& doc, bool& dirty) {
        doc = {{"messages", "not a list"}};
        dirty = true;
        return std::error_code{};
    });
    assert(!seeded);

    MailboxStore box(store, quiet_logger());
    assert(box.append("w1", make_message("x")) == FleetErrc::CorruptDocument);
    assert(box.compact("w1", 0) == FleetErrc::CorruptDocument);
    assert((*store->load("w1"))["messages"] == "not a list");
    assert(box.unread_count("w1") == 0);

    bool threw = false;
    try {
        MailboxStore bad(nullptr, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "corrupt mailbox OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Mailbox Store Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_unread_counting();
    test_order_ids_and_timestamps();
    test_mark_read();
    test_lock_timeout_leaves_mailbox_untouched();
    test_concurrent_appends();
    test_compact_drops_oldest_read();
    test_compact_respects_lock();
    test_corrupt_mailbox_not_rewritten();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}

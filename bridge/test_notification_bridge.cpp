//
// Notification bridge tests
//
// Loop prevention, append-before-ack ordering, and the ntfy line codec.
//

#include "bridge/NotificationBridge.hpp"
#include "bridge/StreamAckChannel.hpp"
#include "store/FileDocumentStore.hpp"
#include "store/FileLock.hpp"
#include "store/MemoryDocumentStore.hpp"
#include "FleetError.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace TaskFleet;
using namespace TaskFleet::Bridge;
namespace fs = std::filesystem;

/// Records acknowledgments; can be told to fail.
class RecordingAckChannel : public IAckChannel {
public:
    std::error_code send(const std::string& text, const std::vector<std::string>& tags) override {
        ++attempts;
        if (fail) return FleetErrc::ChannelFailure;
        sent.push_back(text);
        last_tags = tags;
        return {};
    }

    bool fail = false;
    int attempts = 0;
    std::vector<std::string> sent;
    std::vector<std::string> last_tags;
};

static InboundEvent message_event(const std::string& content, std::vector<std::string> tags = {}) {
    InboundEvent ev;
    ev.event_kind = "message";
    ev.id = "ev1";
    ev.timestamp = 1760000000;
    ev.content = content;
    ev.tags = std::move(tags);
    return ev;
}

struct Fixture {
    std::shared_ptr<Logger> logger = std::make_shared<Logger>("test");
    std::shared_ptr<VectorSink> sink = std::make_shared<VectorSink>();
    std::shared_ptr<Mailbox::MailboxStore> mailboxes;
    std::shared_ptr<RecordingAckChannel> ack = std::make_shared<RecordingAckChannel>();
    std::unique_ptr<NotificationBridge> bridge;

    explicit Fixture(std::shared_ptr<Store::IDocumentStore> store = std::make_shared<Store::MemoryDocumentStore>(),
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
        sink->set_level(LogLevel::Debug);
        logger->add_sink(sink);
        mailboxes = std::make_shared<Mailbox::MailboxStore>(store, logger, timeout);
        bridge = std::make_unique<NotificationBridge>(mailboxes, ack, BridgeSettings{}, logger);
    }
};

void test_non_message_events_ignored() {
    std::cout << "=== Test: non-message events ===" << std::endl;
    Fixture f;

    InboundEvent keepalive;
    keepalive.event_kind = "keepalive";
    assert(f.bridge->on_external_event(keepalive).outcome == BridgeOutcome::Ignored);

    assert(f.bridge->on_external_event(message_event("")).outcome == BridgeOutcome::Ignored);
    assert(f.mailboxes->messages("owner").empty());
    assert(f.ack->attempts == 0);

    std::cout << "ignored OK" << std::endl << std::endl;
}

void test_outbound_tag_suppressed() {
    std::cout << "=== Test: own acknowledgment is not re-delivered ===" << std::endl;
    Fixture f;

    auto r = f.bridge->on_external_event(message_event("[received] hello", {"outbound"}));
    assert(r.outcome == BridgeOutcome::LoopSuppressed);
    assert(f.mailboxes->messages("owner").empty());
    assert(f.ack->attempts == 0);

    std::cout << "loop suppression OK" << std::endl << std::endl;
}

void test_delivery_and_ack() {
    std::cout << "=== Test: delivery then acknowledgment ===" << std::endl;
    Fixture f;

    auto r = f.bridge->on_external_event(message_event("deploy the fix", {"phone"}));
    assert(r.outcome == BridgeOutcome::Delivered);
    assert(!r.error);

    auto msgs = f.mailboxes->messages("owner");
    assert(msgs.size() == 1);
    assert(msgs[0].id == r.message_id);
    assert(msgs[0].from == "ntfy");
    assert(msgs[0].type == Mailbox::message_types::ExternalMessage);
    assert(msgs[0].content == "deploy the fix");
    assert(!msgs[0].read);

    assert(f.ack->sent.size() == 1);
    assert(f.ack->sent[0] == "[received] deploy the fix");
    assert(f.ack->last_tags == std::vector<std::string>{kOutboundTag});

    std::cout << "delivery OK" << std::endl << std::endl;
}

void test_ack_failure_keeps_delivery() {
    std::cout << "=== Test: acknowledgment failure ===" << std::endl;
    Fixture f;
    f.ack->fail = true;

    auto r = f.bridge->on_external_event(message_event("still lands"));
    assert(r.outcome == BridgeOutcome::DeliveredAckFailed);
    assert(r.error == FleetErrc::ChannelFailure);
    assert(f.ack->attempts == 1);  // no retry
    assert(f.mailboxes->unread_count("owner") == 1);
    assert(f.sink->contains("acknowledgment failed"));

    std::cout << "ack failure OK" << std::endl << std::endl;
}

void test_append_failure_sends_no_ack() {
    std::cout << "=== Test: append lock timeout means no acknowledgment ===" << std::endl;
    std::string tmpl = (fs::temp_directory_path() / "taskfleet_bridge_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = ::mkdtemp(buf.data());
    assert(created != nullptr);
    fs::path dir(created);

    auto store = std::make_shared<Store::FileDocumentStore>(dir);
    Fixture f(store, std::chrono::milliseconds(40));

    Store::FileLock holder(store->lock_path("owner"));
    assert(holder.acquire(std::chrono::milliseconds(1000)));

    auto r = f.bridge->on_external_event(message_event("lost?"));
    assert(r.outcome == BridgeOutcome::AppendFailed);
    assert(r.error == FleetErrc::LockTimeout);
    assert(f.ack->attempts == 0);
    assert(f.mailboxes->messages("owner").empty());

    holder.release();
    assert(f.bridge->on_external_event(message_event("retry")).outcome == BridgeOutcome::Delivered);
    assert(f.ack->sent.size() == 1);

    fs::remove_all(dir);
    std::cout << "append failure OK" << std::endl << std::endl;
}

void test_event_parsing() {
    std::cout << "=== Test: ntfy line parsing ===" << std::endl;

    auto ev = InboundEvent::parse(R"({"id":"abc","time":1760000000,"event":"message","topic":"fleet","message":"hi","tags":["outbound","x"]})");
    assert(ev);
    assert(ev->event_kind == "message");
    assert(ev->id == "abc");
    assert(ev->timestamp == 1760000000);
    assert(ev->content == "hi");
    assert(ev->has_tag("outbound") && ev->has_tag("x") && !ev->has_tag("y"));

    auto keepalive = InboundEvent::parse(R"({"id":"k","time":1,"event":"keepalive","topic":"fleet"})");
    assert(keepalive && keepalive->event_kind == "keepalive" && keepalive->content.empty());

    assert(!InboundEvent::parse("not json"));
    assert(!InboundEvent::parse("[1,2]"));
    assert(!InboundEvent::parse(R"({"message":"no kind"})"));

    std::cout << "parsing OK" << std::endl << std::endl;
}

void test_stream_ack_channel() {
    std::cout << "=== Test: JSON-lines acknowledgment stream ===" << std::endl;

    std::ostringstream out;
    StreamAckChannel channel(out);
    assert(!channel.send("[received] ok", {kOutboundTag}));
    auto line = out.str();
    assert(!line.empty() && line.back() == '\n');
    auto j = nlohmann::json::parse(line);
    assert(j["message"] == "[received] ok");
    assert(j["tags"] == nlohmann::json::array({"outbound"}));

    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    StreamAckChannel failing(broken);
    assert(failing.send("x", {}) == FleetErrc::ChannelFailure);

    std::cout << "stream channel OK" << std::endl << std::endl;
}

int main() {
    std::cout << "\n========================================" << std::endl;
    std::cout << "Notification Bridge Tests" << std::endl;
    std::cout << "========================================\n" << std::endl;

    test_non_message_events_ignored();
    test_outbound_tag_suppressed();
    test_delivery_and_ack();
    test_ack_failure_keeps_delivery();
    test_append_failure_sends_no_ack();
    test_event_parsing();
    test_stream_ack_channel();

    std::cout << "========================================" << std::endl;
    std::cout << "All tests completed successfully!" << std::endl;
    std::cout << "========================================\n" << std::endl;
    return 0;
}

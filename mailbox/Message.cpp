#include "Message.hpp"

namespace TaskFleet::Mailbox {

void to_json(nlohmann::json& j, const Message& m) {
    j = nlohmann::json{
        {"id", m.id},
        {"from", m.from},
        {"type", m.type},
        {"content", m.content},
        {"timestamp", m.timestamp},
        {"read", m.read},
    };
}

void from_json(const nlohmann::json& j, Message& m) {
    m.id = j.value("id", std::string{});
    m.from = j.value("from", std::string{});
    m.type = j.value("type", std::string{});
    m.content = j.value("content", std::string{});
    m.timestamp = j.value("timestamp", std::string{});
    m.read = j.value("read", false);
}

} // namespace TaskFleet::Mailbox

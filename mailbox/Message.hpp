// Message.hpp - Mailbox message record and its JSON form
#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace TaskFleet::Mailbox {

/**
 * \brief Well-known message types.
 */
namespace message_types {
inline constexpr const char* TaskAssigned = "task_assigned";
inline constexpr const char* ModelSwitch = "model_switch";
inline constexpr const char* ReportReceived = "report_received";
inline constexpr const char* Info = "info";
inline constexpr const char* ExternalMessage = "external_message";
} // namespace message_types

/**
 * \brief One mailbox entry. The recipient is implicit: the owning mailbox.
 *
 * Once appended only `read` ever changes, and only from false to true.
 */
struct Message {
    std::string id;         ///< Unique within the mailbox; generated on append when empty.
    std::string from;
    std::string type;
    std::string content;
    bool read = false;
    std::string timestamp;  ///< Local `YYYY-MM-DDTHH:MM:SS`; filled on append when empty.
};

void to_json(nlohmann::json& j, const Message& m);

/// Missing fields default to empty strings; a missing `read` reads as false.
void from_json(const nlohmann::json& j, Message& m);

} // namespace TaskFleet::Mailbox

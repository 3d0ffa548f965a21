// NotificationBridge.hpp - Inbound notifications into the owner's mailbox
#pragma once

#include "IAckChannel.hpp"
#include "InboundEvent.hpp"
#include "mailbox/MailboxStore.hpp"
#include "logger.hpp"

#include <memory>
#include <string>
#include <system_error>

namespace TaskFleet::Bridge {

/**
 * \defgroup bridge_module Notification Bridge Module
 * \brief Turns external push notifications into mailbox entries.
 */

enum class BridgeOutcome {
    Ignored,             ///< Not a message event, or empty content.
    LoopSuppressed,      ///< Carried the outbound tag: our own acknowledgment.
    Delivered,           ///< Appended and acknowledged.
    DeliveredAckFailed,  ///< Appended; acknowledgment could not be sent.
    AppendFailed         ///< Not appended; no acknowledgment attempted.
};

std::string to_string(BridgeOutcome outcome);

struct BridgeResult {
    BridgeOutcome outcome = BridgeOutcome::Ignored;
    std::error_code error;       ///< Append or acknowledgment failure, if any.
    std::string message_id;      ///< Mailbox id on delivery.
};

struct BridgeSettings {
    std::string owner_id = "owner";       ///< Mailbox receiving every inbound message.
    std::string source = "ntfy";          ///< `from` of the appended messages.
    std::string ack_prefix = "[received] ";
};

/**
 * \brief Applies inbound events to the owner mailbox.
 * \ingroup bridge_module
 *
 * Acknowledgments travel over the same channel the bridge reads, so an event
 * tagged outbound is dropped before it can reach the mailbox. The ack is only
 * sent after the append succeeded; an ack failure never undoes the delivery.
 */
class NotificationBridge {
public:
    NotificationBridge(std::shared_ptr<Mailbox::MailboxStore> mailboxes,
                       std::shared_ptr<IAckChannel> ack_channel,
                       BridgeSettings settings,
                       std::shared_ptr<Logger> logger);

    BridgeResult on_external_event(const InboundEvent& event);

    /** \brief Acknowledgment text: prefix followed by the verbatim content. */
    std::string acknowledgment_for(const std::string& content) const;

    const BridgeSettings& settings() const { return settings_; }

private:
    std::shared_ptr<Mailbox::MailboxStore> mailboxes_;
    std::shared_ptr<IAckChannel> ack_channel_;
    BridgeSettings settings_;
    std::shared_ptr<Logger> logger_;
};

} // namespace TaskFleet::Bridge

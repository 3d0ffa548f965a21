#include "NotificationBridge.hpp"

#include <stdexcept>

namespace TaskFleet::Bridge {

std::string to_string(BridgeOutcome outcome) {
    switch (outcome) {
        case BridgeOutcome::Ignored:            return "ignored";
        case BridgeOutcome::LoopSuppressed:     return "loop-suppressed";
        case BridgeOutcome::Delivered:          return "delivered";
        case BridgeOutcome::DeliveredAckFailed: return "delivered-ack-failed";
        case BridgeOutcome::AppendFailed:       return "append-failed";
    }
    return "unknown";
}

NotificationBridge::NotificationBridge(std::shared_ptr<Mailbox::MailboxStore> mailboxes,
                                       std::shared_ptr<IAckChannel> ack_channel,
                                       BridgeSettings settings,
                                       std::shared_ptr<Logger> logger)
    : mailboxes_(std::move(mailboxes))
    , ack_channel_(std::move(ack_channel))
    , settings_(std::move(settings))
    , logger_(std::move(logger)) {
    if (!mailboxes_ || !ack_channel_ || !logger_) {
        throw std::invalid_argument("NotificationBridge: mailboxes, ack_channel, and logger cannot be null");
    }
}

std::string NotificationBridge::acknowledgment_for(const std::string& content) const {
    return settings_.ack_prefix + content;
}

BridgeResult NotificationBridge::on_external_event(const InboundEvent& event) {
    BridgeResult result;

    if (event.event_kind != "message" || event.content.empty()) {
        logger_->debug("[Bridge] ignoring " + event.event_kind + " event " + event.id);
        return result;
    }

    if (event.has_tag(kOutboundTag)) {
        logger_->debug("[Bridge] dropped own acknowledgment " + event.id);
        result.outcome = BridgeOutcome::LoopSuppressed;
        return result;
    }

    Mailbox::Message message;
    message.from = settings_.source;
    message.type = Mailbox::message_types::ExternalMessage;
    message.content = event.content;

    if (auto ec = mailboxes_->append(settings_.owner_id, std::move(message), &result.message_id)) {
        logger_->error("[Bridge] event " + event.id + " not delivered to " + settings_.owner_id + ": " + ec.message());
        result.outcome = BridgeOutcome::AppendFailed;
        result.error = ec;
        return result;
    }

    if (auto ec = ack_channel_->send(acknowledgment_for(event.content), {kOutboundTag})) {
        logger_->warning("[Bridge] event " + event.id + " delivered as " + result.message_id +
                         " but acknowledgment failed: " + ec.message());
        result.outcome = BridgeOutcome::DeliveredAckFailed;
        result.error = ec;
        return result;
    }

    logger_->info("[Bridge] event " + event.id + " delivered to " + settings_.owner_id + " as " + result.message_id);
    result.outcome = BridgeOutcome::Delivered;
    return result;
}

} // namespace TaskFleet::Bridge

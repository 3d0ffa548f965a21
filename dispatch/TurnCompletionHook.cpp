#include "TurnCompletionHook.hpp"

#include <nlohmann/json.hpp>

#include <iterator>
#include <stdexcept>

namespace TaskFleet::Dispatch {

namespace {

// First `limit` code points of a UTF-8 string.
std::string truncate_utf8(const std::string& text, std::size_t limit) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (count == limit) return text.substr(0, i);
            ++count;
        }
    }
    return text;
}

} // namespace

std::string HookDecision::to_json_line() const {
    if (allow) return {};
    nlohmann::json j;
    j["decision"] = "block";
    j["reason"] = reason;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

TurnCompletionHook::TurnCompletionHook(std::shared_ptr<Mailbox::MailboxStore> mailboxes,
                                       HookSettings settings,
                                       std::shared_ptr<Logger> logger)
    : mailboxes_(std::move(mailboxes)), settings_(std::move(settings)), logger_(std::move(logger)) {
    if (!mailboxes_ || !logger_) throw std::invalid_argument("TurnCompletionHook requires mailboxes and logger");
}

std::string TurnCompletionHook::mailbox_location(const std::string& worker_id) const {
    if (settings_.mailbox_dir.empty()) return worker_id + ".json";
    return settings_.mailbox_dir + "/" + worker_id + ".json";
}

HookDecision TurnCompletionHook::evaluate(const std::string& worker_id, TurnDeferral deferral) const {
    if (worker_id.empty() || worker_id == settings_.owner_id) return HookDecision::Allow();
    if (deferral == TurnDeferral::DeferredOnce) {
        logger_->debug("[Hook] " + worker_id + " already deferred once; allowing");
        return HookDecision::Allow();
    }

    auto unread = mailboxes_->unread(worker_id);
    if (unread.empty()) return HookDecision::Allow();

    std::string summary;
    for (std::size_t i = 0; i < unread.size() && i < kSummaryMessages; ++i) {
        const auto& m = unread[i];
        if (!summary.empty()) summary += " | ";
        summary += "[" + m.from + "/" + m.type + "] " + truncate_utf8(m.content, kContentChars);
    }

    logger_->info("[Hook] holding turn end of " + worker_id + ": " + std::to_string(unread.size()) + " unread");
    return HookDecision::Block(std::to_string(unread.size()) + " unread message(s) in " +
                               mailbox_location(worker_id) + ". Read and process them. Contents: " + summary);
}

HookDecision TurnCompletionHook::on_turn_end(Worker& worker) const {
    auto decision = evaluate(worker.id, worker.deferral);
    worker.deferral = decision.allow ? TurnDeferral::NotDeferred : TurnDeferral::DeferredOnce;
    return decision;
}

HookDecision TurnCompletionHook::evaluate_payload(const std::string& worker_id, std::istream& input) const {
    Worker worker;
    worker.id = worker_id;
    std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    auto payload = nlohmann::json::parse(text, nullptr, false);
    if (!payload.is_discarded() && payload.is_object()) {
        auto it = payload.find("stop_hook_active");
        if (it != payload.end() && it->is_boolean() && it->get<bool>()) worker.deferral = TurnDeferral::DeferredOnce;
    } else if (!text.empty()) {
        logger_->warning("[Hook] hook payload is not a JSON object; treating turn as not deferred");
    }
    return on_turn_end(worker);
}

} // namespace TaskFleet::Dispatch

/**
 * \file mailbox/MailboxStore.cpp
 * \brief Append / read-tracking logic for worker mailboxes.
 * \ingroup mailbox_module
 */
#include "MailboxStore.hpp"
#include "FleetError.hpp"
#include "timeUtils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <unordered_set>

namespace TaskFleet::Mailbox {

namespace {

constexpr const char* kMessagesKey = "messages";

// Decode the stored message list. Entries that fail to decode are skipped on
// the read path; the write path refuses to rewrite such a mailbox.
bool decode_messages(const nlohmann::json& doc, std::vector<Message>& out) {
    out.clear();
    if (doc.is_null()) return true;
    if (!doc.is_object()) return false;
    auto it = doc.find(kMessagesKey);
    if (it == doc.end() || it->is_null()) return true;
    if (!it->is_array()) return false;

    bool clean = true;
    for (const auto& entry : *it) {
        try {
            out.push_back(entry.get<Message>());
        } catch (const nlohmann::json::exception&) {
            clean = false;
        }
    }
    return clean;
}

// Locate (or create) the messages array inside a document under mutation.
nlohmann::json* messages_array(nlohmann::json& doc) {
    if (doc.is_null()) {
        doc = nlohmann::json::object();
    }
    if (!doc.is_object()) return nullptr;
    auto& arr = doc[kMessagesKey];
    if (arr.is_null()) arr = nlohmann::json::array();
    if (!arr.is_array()) return nullptr;
    for (const auto& entry : arr) {
        if (!entry.is_object()) return nullptr;
        auto id = entry.find("id");
        if (id != entry.end() && !id->is_string()) return nullptr;
    }
    return &arr;
}

} // namespace

MailboxStore::MailboxStore(std::shared_ptr<Store::IDocumentStore> store,
                           std::shared_ptr<Logger> logger,
                           std::chrono::milliseconds lock_timeout)
    : store_(std::move(store))
    , logger_(std::move(logger))
    , lock_timeout_(lock_timeout) {
    if (!store_) {
        throw std::invalid_argument("MailboxStore: store cannot be null");
    }
}

std::string MailboxStore::generate_message_id() {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist;
    char suffix[9];
    std::snprintf(suffix, sizeof(suffix), "%08x", dist(rng));
    return "msg_" + now_compact_stamp() + "_" + suffix;
}

std::error_code MailboxStore::append(const std::string& worker_id, Message message, std::string* assigned_id) {
    message.read = false;
    if (message.timestamp.empty()) message.timestamp = now_timestamp();

    auto ec = store_->update(worker_id, lock_timeout_, [&](nlohmann::json& doc, bool& dirty) -> std::error_code {
        auto* arr = messages_array(doc);
        if (!arr) return FleetErrc::CorruptDocument;

        std::unordered_set<std::string> taken;
        for (const auto& entry : *arr) {
            taken.insert(entry.value("id", std::string{}));
        }
        while (message.id.empty() || taken.count(message.id) > 0) {
            message.id = generate_message_id();
        }

        arr->push_back(message);
        dirty = true;
        return {};
    });

    if (ec) {
        log_failure("append", worker_id, ec);
        return ec;
    }
    if (assigned_id) *assigned_id = message.id;
    if (logger_) {
        logger_->debug("[Mailbox] " + worker_id + " <- " + message.id + " (" + message.type + " from " + message.from + ")");
    }
    return {};
}

std::vector<Message> MailboxStore::messages(const std::string& worker_id) const {
    std::vector<Message> result;
    auto doc = store_->load(worker_id);
    if (!doc) return result;
    if (!decode_messages(*doc, result) && logger_) {
        logger_->warning("[Mailbox] " + worker_id + ": skipped malformed entries while reading");
    }
    return result;
}

std::vector<Message> MailboxStore::unread(const std::string& worker_id) const {
    auto all = messages(worker_id);
    all.erase(std::remove_if(all.begin(), all.end(), [](const Message& m) { return m.read; }), all.end());
    return all;
}

std::size_t MailboxStore::unread_count(const std::string& worker_id) const {
    auto all = messages(worker_id);
    return static_cast<std::size_t>(std::count_if(all.begin(), all.end(), [](const Message& m) { return !m.read; }));
}

std::error_code MailboxStore::mark_all_read(const std::string& worker_id) {
    return mark(worker_id, nullptr);
}

std::error_code MailboxStore::mark_read(const std::string& worker_id, const std::string& message_id) {
    return mark(worker_id, &message_id);
}

std::error_code MailboxStore::mark(const std::string& worker_id, const std::string* only_id) {
    auto ec = store_->update(worker_id, lock_timeout_, [&](nlohmann::json& doc, bool& dirty) -> std::error_code {
        if (doc.is_null()) {
            return only_id ? std::error_code(FleetErrc::NotFound) : std::error_code{};
        }
        auto* arr = messages_array(doc);
        if (!arr) return FleetErrc::CorruptDocument;

        bool found = false;
        for (auto& entry : *arr) {
            if (only_id && entry.value("id", std::string{}) != *only_id) continue;
            found = true;
            auto read = entry.find("read");
            if (read == entry.end() || !read->is_boolean() || !read->get<bool>()) {
                entry["read"] = true;
                dirty = true;
            }
        }
        if (only_id && !found) return FleetErrc::NotFound;
        return {};
    });
    if (ec) log_failure(only_id ? "mark_read" : "mark_all_read", worker_id, ec);
    return ec;
}

std::error_code MailboxStore::compact(const std::string& worker_id, std::size_t keep_read, std::size_t* removed) {
    std::size_t dropped = 0;
    auto ec = store_->update(worker_id, lock_timeout_, [&](nlohmann::json& doc, bool& dirty) -> std::error_code {
        if (doc.is_null()) return {};
        auto* arr = messages_array(doc);
        if (!arr) return FleetErrc::CorruptDocument;

        auto is_read = [](const nlohmann::json& entry) {
            auto read = entry.find("read");
            return read != entry.end() && read->is_boolean() && read->get<bool>();
        };
        std::size_t read_total = static_cast<std::size_t>(std::count_if(arr->begin(), arr->end(), is_read));
        if (read_total <= keep_read) return {};

        std::size_t to_drop = read_total - keep_read;
        nlohmann::json kept = nlohmann::json::array();
        for (auto& entry : *arr) {
            if (to_drop > 0 && is_read(entry)) {
                --to_drop;
                ++dropped;
                continue;
            }
            kept.push_back(std::move(entry));
        }
        *arr = std::move(kept);
        dirty = true;
        return {};
    });
    if (ec) {
        log_failure("compact", worker_id, ec);
        return ec;
    }
    if (removed) *removed = dropped;
    if (dropped > 0 && logger_) {
        logger_->info("[Mailbox] " + worker_id + ": dropped " + std::to_string(dropped) + " read message(s)");
    }
    return {};
}

void MailboxStore::log_failure(const std::string& op, const std::string& worker_id, const std::error_code& ec) const {
    if (logger_) {
        logger_->warning("[Mailbox] " + op + " on " + worker_id + " failed: " + ec.message());
    }
}

} // namespace TaskFleet::Mailbox

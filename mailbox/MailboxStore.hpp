// MailboxStore.hpp - Durable per-worker inbox with read tracking
#pragma once

#include "Message.hpp"
#include "store/IDocumentStore.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace TaskFleet::Mailbox {

/**
 * \defgroup mailbox_module Mailbox Module
 * \brief Ordered, exactly-once message logs, one per worker.
 */

/**
 * \brief Mailbox operations over an IDocumentStore keyed by worker id.
 * \ingroup mailbox_module
 *
 * Document form: `{"messages": [ {...}, ... ]}` in insertion order. A mailbox
 * comes into existence on its first append and is never deleted here.
 *
 * Mutations take the worker's mailbox lock with a bounded wait and either
 * fully persist or leave the stored mailbox untouched. Reads take no lock.
 */
class MailboxStore {
public:
    static constexpr std::chrono::milliseconds kDefaultLockTimeout{10000};

    MailboxStore(std::shared_ptr<Store::IDocumentStore> store,
                 std::shared_ptr<Logger> logger,
                 std::chrono::milliseconds lock_timeout = kDefaultLockTimeout);

    /**
     * \brief Append a message with read=false.
     *
     * Fills `id` and `timestamp` when empty. An id that collides with an
     * existing message is replaced by a generated one.
     * \param assigned_id Receives the stored id on success (may be null).
     * \return FleetErrc::LockTimeout or a store error on failure; the caller
     *         must not assume delivery unless the result is success.
     */
    std::error_code append(const std::string& worker_id, Message message, std::string* assigned_id = nullptr);

    /** \brief Unread messages; 0 for a mailbox that does not exist. */
    std::size_t unread_count(const std::string& worker_id) const;

    /** \brief Snapshot of every message in insertion order. */
    std::vector<Message> messages(const std::string& worker_id) const;

    /** \brief Snapshot of unread messages in insertion order. */
    std::vector<Message> unread(const std::string& worker_id) const;

    /** \brief Mark every message read. No-op on an empty or absent mailbox. */
    std::error_code mark_all_read(const std::string& worker_id);

    /**
     * \brief Mark one message read.
     * \return FleetErrc::NotFound when no message carries \p message_id.
     */
    std::error_code mark_read(const std::string& worker_id, const std::string& message_id);

    /**
     * \brief Drop the oldest read messages, keeping the newest \p keep_read of them.
     *
     * Unread messages are never removed and the survivors keep their order.
     * Takes the mailbox lock like any other mutation; an absent mailbox is a no-op.
     * \param removed Receives the number of dropped messages on success (may be null).
     */
    std::error_code compact(const std::string& worker_id, std::size_t keep_read, std::size_t* removed = nullptr);

    std::chrono::milliseconds lock_timeout() const { return lock_timeout_; }

    /** \brief `msg_YYYYmmdd_HHMMSS_xxxxxxxx`. */
    static std::string generate_message_id();

private:
    std::error_code mark(const std::string& worker_id, const std::string* only_id);
    void log_failure(const std::string& op, const std::string& worker_id, const std::error_code& ec) const;

    std::shared_ptr<Store::IDocumentStore> store_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds lock_timeout_;
};

} // namespace TaskFleet::Mailbox

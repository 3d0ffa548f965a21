// TurnCompletionHook.hpp - Holds a worker's turn end while its mailbox has unread mail
#pragma once

#include "Worker.hpp"
#include "mailbox/MailboxStore.hpp"
#include "logger.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace TaskFleet::Dispatch {

/**
 * \brief Outcome of one turn-end check. `allow == false` carries a reason.
 */
struct HookDecision {
    bool allow = true;
    std::string reason;

    static HookDecision Allow() { return {}; }
    static HookDecision Block(std::string why) { return {false, std::move(why)}; }

    /** \brief `{"decision":"block","reason":...}`; empty for an allow. */
    std::string to_json_line() const;
};

struct HookSettings {
    std::string owner_id = "owner";
    std::string mailbox_dir = "queue/inbox";  ///< Only used to tell the worker where to look.
};

/**
 * \brief Delivery path for busy workers: a worker is never interrupted, but
 * the end of its turn is held back once so it reads the mail first.
 * \ingroup dispatch_module
 *
 * Order of checks: the owner is never blocked, a turn already deferred once is
 * let through (so the loop always terminates), an empty mailbox is let through,
 * everything else blocks with a summary of up to kSummaryMessages unread
 * messages.
 */
class TurnCompletionHook {
public:
    static constexpr std::size_t kSummaryMessages = 5;
    static constexpr std::size_t kContentChars = 80;

    TurnCompletionHook(std::shared_ptr<Mailbox::MailboxStore> mailboxes,
                       HookSettings settings,
                       std::shared_ptr<Logger> logger);

    HookDecision evaluate(const std::string& worker_id, TurnDeferral deferral) const;

    /**
     * \brief Evaluate the worker's turn end and advance its deferral flag.
     *
     * A block leaves the worker DeferredOnce, so the next turn end goes
     * through; an allow clears the flag for the following turn.
     */
    HookDecision on_turn_end(Worker& worker) const;

    /**
     * \brief Evaluate from the host program's hook payload on \p input.
     *
     * Each hook invocation is its own process, so the host carries the flag:
     * `stop_hook_active: true` in the payload means DeferredOnce. An empty or
     * unreadable payload counts as NotDeferred. An empty \p worker_id allows.
     */
    HookDecision evaluate_payload(const std::string& worker_id, std::istream& input) const;

    std::string mailbox_location(const std::string& worker_id) const;

private:
    std::shared_ptr<Mailbox::MailboxStore> mailboxes_;
    HookSettings settings_;
    std::shared_ptr<Logger> logger_;
};

} // namespace TaskFleet::Dispatch

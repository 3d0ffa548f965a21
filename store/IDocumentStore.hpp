/**
 * \file store/IDocumentStore.hpp
 * \brief Key-value store of JSON documents with per-key exclusive mutation.
 * \ingroup store_module
 */
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace TaskFleet::Store {

/**
 * \defgroup store_module Document Store Module
 * \brief Persistence seam shared by mailboxes and the task registry.
 */

/**
 * \brief Storage backend for per-worker documents.
 * \ingroup store_module
 *
 * Contract:
 * - load() is a lock-free snapshot; a concurrent writer may replace the
 *   document right after. Absent and unparsable documents both read as nullopt.
 * - update() serializes writers of the same key through a lock scoped to that
 *   key only. Unrelated keys never contend.
 * - A write is all-or-nothing: readers see either the old or the new document.
 */
class IDocumentStore {
public:
    /**
     * \brief Read-modify-write callback.
     *
     * `doc` holds the current document, or null when the key does not exist yet.
     * Set `dirty` to persist the modified document. A non-zero return aborts the
     * update without writing and is returned from update().
     */
    using Mutator = std::function<std::error_code(nlohmann::json& doc, bool& dirty)>;

    virtual ~IDocumentStore() = default;

    virtual std::optional<nlohmann::json> load(const std::string& key) const = 0;

    /**
     * \brief Exclusive read-modify-write of one document.
     * \param lock_timeout Bound on waiting for the key's lock.
     * \return FleetErrc::LockTimeout, FleetErrc::CorruptDocument, FleetErrc::IoFailure,
     *         FleetErrc::InvalidKey, the mutator's own error, or success.
     */
    virtual std::error_code update(const std::string& key,
                                   std::chrono::milliseconds lock_timeout,
                                   const Mutator& mutate) = 0;

    /** \brief Every key with a stored document, sorted. */
    virtual std::vector<std::string> keys() const = 0;
};

/**
 * \brief Keys double as file names: non-empty, no separators, no leading dot.
 */
inline bool is_valid_key(std::string_view key) {
    if (key.empty() || key.front() == '.') return false;
    return key.find_first_of("/\\") == std::string_view::npos && key.find('\0') == std::string_view::npos;
}

} // namespace TaskFleet::Store

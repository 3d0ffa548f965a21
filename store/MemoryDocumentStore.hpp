// MemoryDocumentStore.hpp - In-process IDocumentStore for tests and embedding
#pragma once

#include "IDocumentStore.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace TaskFleet::Store {

/**
 * \brief IDocumentStore kept in memory.
 * \ingroup store_module
 *
 * Each key owns a std::timed_mutex that plays the role of the lock file.
 * load() hands out copies, never references into the store.
 */
class MemoryDocumentStore : public IDocumentStore {
public:
    MemoryDocumentStore() = default;

    MemoryDocumentStore(const MemoryDocumentStore&) = delete;
    MemoryDocumentStore& operator=(const MemoryDocumentStore&) = delete;

    std::optional<nlohmann::json> load(const std::string& key) const override;

    std::error_code update(const std::string& key,
                           std::chrono::milliseconds lock_timeout,
                           const Mutator& mutate) override;

    std::vector<std::string> keys() const override;

private:
    struct Slot {
        std::timed_mutex writer;
        std::optional<nlohmann::json> doc;
    };

    std::shared_ptr<Slot> slot_for(const std::string& key);

    mutable std::mutex map_mutex_;  // guards slots_ and every Slot::doc
    std::map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace TaskFleet::Store

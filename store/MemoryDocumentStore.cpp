#include "MemoryDocumentStore.hpp"
#include "FleetError.hpp"

namespace TaskFleet::Store {

std::shared_ptr<MemoryDocumentStore::Slot> MemoryDocumentStore::slot_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = slots_[key];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

std::optional<nlohmann::json> MemoryDocumentStore::load(const std::string& key) const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) return std::nullopt;
    return it->second->doc;
}

std::error_code MemoryDocumentStore::update(const std::string& key,
                                            std::chrono::milliseconds lock_timeout,
                                            const Mutator& mutate) {
    if (!is_valid_key(key)) return FleetErrc::InvalidKey;

    auto slot = slot_for(key);
    std::unique_lock<std::timed_mutex> writer(slot->writer, std::defer_lock);
    if (!writer.try_lock_for(lock_timeout)) {
        return FleetErrc::LockTimeout;
    }

    nlohmann::json doc;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (slot->doc) doc = *slot->doc;
    }

    bool dirty = false;
    if (auto ec = mutate(doc, dirty)) {
        return ec;
    }
    if (dirty) {
        std::lock_guard<std::mutex> lock(map_mutex_);
        slot->doc = std::move(doc);
    }
    return {};
}

std::vector<std::string> MemoryDocumentStore::keys() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    std::vector<std::string> result;
    for (const auto& [key, slot] : slots_) {
        if (slot->doc) result.push_back(key);
    }
    return result;
}

} // namespace TaskFleet::Store

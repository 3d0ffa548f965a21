// FileDocumentStore.hpp - One JSON file per key under a directory
#pragma once

#include "IDocumentStore.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>

namespace TaskFleet::Store {

/**
 * \brief Directory-backed IDocumentStore.
 * \ingroup store_module
 *
 * Layout: `<dir>/<key>.json` holds the document, `<dir>/<key>.json.lock` is the
 * flock() target. Writes go to a mkstemp() file in the same directory, are
 * fsync'ed and renamed over the document, so readers never observe a partial
 * file and a failed write leaves the previous document in place.
 */
class FileDocumentStore : public IDocumentStore {
public:
    /**
     * \param directory Created (with parents) if missing.
     * \param logger Optional; receives parse and I/O warnings.
     */
    explicit FileDocumentStore(std::filesystem::path directory,
                               std::shared_ptr<Logger> logger = nullptr);

    std::optional<nlohmann::json> load(const std::string& key) const override;

    std::error_code update(const std::string& key,
                           std::chrono::milliseconds lock_timeout,
                           const Mutator& mutate) override;

    std::vector<std::string> keys() const override;

    std::filesystem::path document_path(const std::string& key) const;
    std::filesystem::path lock_path(const std::string& key) const;
    const std::filesystem::path& directory() const { return directory_; }

private:
    std::error_code write_atomic(const std::filesystem::path& target, const std::string& content);
    void log_warning(const std::string& message) const;

    std::filesystem::path directory_;
    std::shared_ptr<Logger> logger_;
};

} // namespace TaskFleet::Store

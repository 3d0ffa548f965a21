/**
 * \file store/FileDocumentStore.cpp
 * \brief flock + write-temp-then-rename persistence of JSON documents.
 * \ingroup store_module
 */
#include "FileDocumentStore.hpp"
#include "FileLock.hpp"
#include "FleetError.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace TaskFleet::Store {

namespace {

constexpr const char* kDocumentSuffix = ".json";

enum class ReadStatus { Ok, Missing, Unreadable };

ReadStatus read_text(const std::filesystem::path& path, std::string& out) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        std::error_code ec;
        return std::filesystem::exists(path, ec) ? ReadStatus::Unreadable : ReadStatus::Missing;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    out = buffer.str();
    return ReadStatus::Ok;
}

bool write_all(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

FileDocumentStore::FileDocumentStore(std::filesystem::path directory, std::shared_ptr<Logger> logger)
    : directory_(std::move(directory))
    , logger_(std::move(logger)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::system_error(ec, "FileDocumentStore: cannot create " + directory_.string());
    }
}

std::filesystem::path FileDocumentStore::document_path(const std::string& key) const {
    return directory_ / (key + kDocumentSuffix);
}

std::filesystem::path FileDocumentStore::lock_path(const std::string& key) const {
    return directory_ / (key + kDocumentSuffix + ".lock");
}

std::optional<nlohmann::json> FileDocumentStore::load(const std::string& key) const {
    if (!is_valid_key(key)) return std::nullopt;

    std::string text;
    auto status = read_text(document_path(key), text);
    if (status == ReadStatus::Missing) return std::nullopt;
    if (status == ReadStatus::Unreadable) {
        log_warning("cannot read " + document_path(key).string());
        return std::nullopt;
    }

    auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        log_warning("ignoring unparsable document " + document_path(key).string());
        return std::nullopt;
    }
    return doc;
}

std::error_code FileDocumentStore::update(const std::string& key,
                                          std::chrono::milliseconds lock_timeout,
                                          const Mutator& mutate) {
    if (!is_valid_key(key)) return FleetErrc::InvalidKey;

    FileLock lock(lock_path(key));
    if (!lock.acquire(lock_timeout)) {
        return FleetErrc::LockTimeout;
    }

    const auto path = document_path(key);
    nlohmann::json doc;  // null: document does not exist yet
    std::string text;
    auto status = read_text(path, text);
    if (status == ReadStatus::Unreadable) {
        log_warning("cannot read " + path.string() + " under lock");
        return FleetErrc::IoFailure;
    }
    if (status == ReadStatus::Ok) {
        doc = nlohmann::json::parse(text, nullptr, false);
        if (doc.is_discarded()) {
            log_warning("refusing to rewrite unparsable document " + path.string());
            return FleetErrc::CorruptDocument;
        }
    }

    bool dirty = false;
    if (auto ec = mutate(doc, dirty)) {
        return ec;
    }
    if (!dirty) {
        return {};
    }
    return write_atomic(path, doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
}

std::error_code FileDocumentStore::write_atomic(const std::filesystem::path& target, const std::string& content) {
    std::string tmpl = (directory_ / ("." + target.filename().string() + ".XXXXXX")).string();
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        log_warning("mkstemp failed in " + directory_.string() + ": " + std::strerror(errno));
        return FleetErrc::IoFailure;
    }
    const std::filesystem::path tmp_path(name.data());

    bool ok = write_all(fd, content) && ::fsync(fd) == 0;
    // mkstemp creates 0600; documents are shared with the worker's own tooling.
    ok = ok && ::fchmod(fd, 0644) == 0;
    if (::close(fd) != 0) ok = false;

    if (ok && ::rename(tmp_path.c_str(), target.c_str()) == 0) {
        return {};
    }

    log_warning("atomic write of " + target.string() + " failed: " + std::strerror(errno));
    std::error_code ignore;
    std::filesystem::remove(tmp_path, ignore);
    return FleetErrc::IoFailure;
}

std::vector<std::string> FileDocumentStore::keys() const {
    std::vector<std::string> result;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (p.extension() != kDocumentSuffix) continue;
        auto stem = p.stem().string();
        if (is_valid_key(stem)) result.push_back(std::move(stem));
    }
    std::sort(result.begin(), result.end());
    return result;
}

void FileDocumentStore::log_warning(const std::string& message) const {
    if (logger_) logger_->warning("[FileDocumentStore] " + message);
}

} // namespace TaskFleet::Store

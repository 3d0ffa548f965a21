// FileLock.hpp - Advisory exclusive lock on a side-car lock file
#pragma once

#include <chrono>
#include <filesystem>

namespace TaskFleet::Store {

/**
 * \brief RAII flock() holder with bounded wait.
 * \ingroup store_module
 *
 * The lock file is created on demand and never removed, so every process
 * contending for the same document locks the same inode.
 */
class FileLock {
public:
    explicit FileLock(std::filesystem::path lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&&) = delete;
    FileLock& operator=(FileLock&&) = delete;

    /**
     * \brief Try to take the lock until \p timeout elapses.
     *
     * Polls with LOCK_NB and exponential backoff (10ms doubling, capped at 1s,
     * never sleeping past the deadline).
     * \return true once held; false on timeout or if the lock file cannot be opened.
     */
    bool acquire(std::chrono::milliseconds timeout);

    void release();

    bool held() const { return fd_ >= 0; }

private:
    std::filesystem::path lock_path_;
    int fd_ = -1;
};

} // namespace TaskFleet::Store

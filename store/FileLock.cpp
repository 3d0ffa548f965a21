#include "FileLock.hpp"

#include <algorithm>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace TaskFleet::Store {

FileLock::FileLock(std::filesystem::path lock_path)
    : lock_path_(std::move(lock_path)) {}

FileLock::~FileLock() {
    release();
}

bool FileLock::acquire(std::chrono::milliseconds timeout) {
    if (fd_ >= 0) return true;

    int fd = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return false;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto backoff = std::chrono::milliseconds(10);

    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            fd_ = fd;
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::close(fd);
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff, remaining));
        backoff = std::min(backoff * 2, std::chrono::milliseconds(1000));
    }
}

void FileLock::release() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace TaskFleet::Store

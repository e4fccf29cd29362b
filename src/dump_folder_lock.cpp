#include "dump_folder_lock.hpp"
#include <cerrno>
#include <cstring>
#include <format>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

std::expected<DumpFolderLock, std::string> DumpFolderLock::acquire(const std::filesystem::path& lockFile) {
    int fd = open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(std::format("Failed to open lock file {}: {}", lockFile.string(), strerror(errno)));
    }

    int ret = -1;
    while (true) {
        ret = flock(fd, LOCK_EX | LOCK_NB);
        if (ret == -1 && errno == EINTR) {
            // The call was interrupted, try again...
            continue;
        }
        break;
    }
    if (ret == -1) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return std::unexpected("Another branch switch is in progress (dump folder is locked)");
        }
        return std::unexpected(std::format("Failed to lock {}: {}", lockFile.string(), strerror(err)));
    }
    return DumpFolderLock(fd);
}

DumpFolderLock::DumpFolderLock(DumpFolderLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

DumpFolderLock& DumpFolderLock::operator=(DumpFolderLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

DumpFolderLock::~DumpFolderLock() {
    release();
}

void DumpFolderLock::release() {
    if (fd_ != -1) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

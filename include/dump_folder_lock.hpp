/**
 * @file dump_folder_lock.hpp
 * @brief Advisory lock serialising hook runs that share a dump folder.
 */

#ifndef DUMP_FOLDER_LOCK_HPP
#define DUMP_FOLDER_LOCK_HPP

#include <expected>
#include <filesystem>
#include <string>

/**
 * @brief Exclusive, non-blocking flock(2) on a lock file, released on destruction.
 */
class DumpFolderLock {
public:
    /**
     * @brief Opens (creating if needed) and locks the file.
     *
     * @param lockFile Lock file path; its directory must exist.
     * @return std::expected<DumpFolderLock, std::string> The held lock, or why it could not be taken.
     */
    static std::expected<DumpFolderLock, std::string> acquire(const std::filesystem::path& lockFile);

    DumpFolderLock(DumpFolderLock&& other) noexcept;
    DumpFolderLock& operator=(DumpFolderLock&& other) noexcept;
    DumpFolderLock(const DumpFolderLock&) = delete;
    DumpFolderLock& operator=(const DumpFolderLock&) = delete;
    ~DumpFolderLock();

private:
    explicit DumpFolderLock(int fd) : fd_(fd) {}
    void release();

    int fd_ = -1;
};

#endif // DUMP_FOLDER_LOCK_HPP

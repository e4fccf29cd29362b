/**
 * @file dump_file_namer.hpp
 * @brief Maps a database and branch to the file holding that branch's snapshot.
 */

#ifndef DUMP_FILE_NAMER_HPP
#define DUMP_FILE_NAMER_HPP

#include <string>
#include <string_view>
#include <filesystem>

/**
 * @brief Deterministic naming of dump files inside the dump folder.
 *
 * The path for a (database, branch) pair is "{dumpFolder}/{database}-{sanitized branch}" with
 * no extension. Sanitizing keeps ASCII letters, digits, '.', '-' and '_' and turns every other
 * byte into '_', so any branch name ("feature/foo bar!") yields a single safe path segment.
 */
class DumpFileNamer {
public:
    explicit DumpFileNamer(std::filesystem::path dumpFolder);

    /**
     * @brief Replaces every byte outside [0-9A-Za-z.-_] with '_'.
     */
    static std::string sanitize(std::string_view branch);

    /**
     * @brief Path of the dump for the given database and branch.
     */
    std::filesystem::path path(std::string_view database, std::string_view branch) const;

    const std::filesystem::path& folder() const { return dumpFolder; }

private:
    std::filesystem::path dumpFolder;
};

#endif // DUMP_FILE_NAMER_HPP

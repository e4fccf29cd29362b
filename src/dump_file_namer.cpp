#include "dump_file_namer.hpp"
#include <format>
#include <utility>

namespace {

bool isSafe(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           c == '.' || c == '-' || c == '_';
}

} // namespace

DumpFileNamer::DumpFileNamer(std::filesystem::path dumpFolder) : dumpFolder(std::move(dumpFolder)) {}

std::string DumpFileNamer::sanitize(std::string_view branch) {
    std::string out(branch);
    for (auto& c : out) {
        if (!isSafe(c)) {
            c = '_';
        }
    }
    return out;
}

std::filesystem::path DumpFileNamer::path(std::string_view database, std::string_view branch) const {
    return dumpFolder / std::format("{}-{}", database, sanitize(branch));
}

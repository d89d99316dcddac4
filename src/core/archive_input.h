#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace quilt::core {

struct ArchiveMember {
    std::string name;
    std::vector<unsigned char> bytes;
};

// Regular files of a tar (plain or compressed) or zip archive, in archive
// order. Directories and special entries are skipped.
bool read_archive_members(const std::filesystem::path& archive_path,
                          std::vector<ArchiveMember>& out,
                          std::string& error);

} // namespace quilt::core

#include "archive_input.h"

#include <array>
#include <cstdint>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

namespace quilt::core {

namespace {

constexpr size_t k_read_block_size = 10240;
constexpr int64_t k_max_member_size = 256LL * 1024LL * 1024LL;

std::string archive_error_text(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown error";
}

} // namespace

bool read_archive_members(const std::filesystem::path& archive_path,
                          std::vector<ArchiveMember>& out,
                          std::string& error) {
    struct archive* a = archive_read_new();
    if (!a) {
        error = "failed to create archive reader";
        return false;
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), k_read_block_size) != ARCHIVE_OK) {
        error = "failed to open archive '" + archive_path.string() + "': " + archive_error_text(a);
        archive_read_free(a);
        return false;
    }

    std::vector<ArchiveMember> members;
    struct archive_entry* entry = nullptr;
    bool ok = true;
    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            error = "failed to read archive header: " + archive_error_text(a);
            ok = false;
            break;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* pathname = archive_entry_pathname(entry);
        ArchiveMember member;
        member.name = pathname ? pathname : "";
        if (archive_entry_size_is_set(entry) != 0 && archive_entry_size(entry) > k_max_member_size) {
            error = "archive member is too large: " + member.name;
            ok = false;
            break;
        }

        std::array<unsigned char, k_read_block_size> buffer{};
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
            member.bytes.insert(member.bytes.end(), buffer.begin(), buffer.begin() + n);
            if (static_cast<int64_t>(member.bytes.size()) > k_max_member_size) {
                break;
            }
        }
        if (n < 0) {
            error = "failed to read archive member '" + member.name + "': " + archive_error_text(a);
            ok = false;
            break;
        }
        if (static_cast<int64_t>(member.bytes.size()) > k_max_member_size) {
            error = "archive member is too large: " + member.name;
            ok = false;
            break;
        }
        members.push_back(std::move(member));
    }

    archive_read_close(a);
    archive_read_free(a);
    if (!ok) {
        return false;
    }
    out = std::move(members);
    return true;
}

} // namespace quilt::core

#pragma once
#include <cstdint>
#include <filesystem>

// Metadata captured next to the digest. Informational only: a change is
// declared on digest mismatch, never on these fields alone.
struct FileAttributes {
    std::uint64_t size = 0;
    std::int64_t modified_ns = 0;   // since the Unix epoch
    std::uint32_t permissions = 0;  // st_mode & 07777

    bool operator==(const FileAttributes& o) const {
        return size == o.size && modified_ns == o.modified_ns && permissions == o.permissions;
    }
    bool operator!=(const FileAttributes& o) const { return !(*this == o); }
};

// stat(2) of `path`, following symlinks. Throws IoError when the path is
// missing, inaccessible or not a regular file.
FileAttributes snapshot_attributes(const std::filesystem::path& path);

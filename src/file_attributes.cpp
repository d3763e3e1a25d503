#include "file_attributes.hpp"
#include "errors.hpp"

#include <sys/stat.h>
#include <sys/types.h>

#include <cerrno>
#include <system_error>

FileAttributes snapshot_attributes(const std::filesystem::path& path){
    struct stat st{};
    if(::stat(path.c_str(), &st) != 0){
        throw IoError(path.string(), std::error_code(errno, std::generic_category()).message());
    }
    if(S_ISDIR(st.st_mode)) throw IoError(path.string(), "is a directory");
    if(!S_ISREG(st.st_mode)) throw IoError(path.string(), "not a regular file");

    FileAttributes attrs;
    attrs.size = static_cast<std::uint64_t>(st.st_size);
    attrs.modified_ns = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL
                      + static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    attrs.permissions = static_cast<std::uint32_t>(st.st_mode & 07777);
    return attrs;
}

#ifndef EDDY_FILE_INFO_HEADER
#define EDDY_FILE_INFO_HEADER

#include <cstdint>
#include <filesystem>

namespace eddy {

/** A file entry as listed in the metadata, before its offset is known. */
struct file_info
{
    // A relative path. At this point path has been sanitized, so it is safe to use.
    std::filesystem::path path;
    // In bytes.
    int64_t length = 0;

    file_info() = default;
    file_info(std::filesystem::path p, int64_t l)
        : path(std::move(p))
        , length(l)
    {}
};

} // namespace eddy

#endif // EDDY_FILE_INFO_HEADER

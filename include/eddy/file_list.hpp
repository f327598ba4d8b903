#ifndef EDDY_FILE_LIST_HEADER
#define EDDY_FILE_LIST_HEADER

#include "file.hpp"
#include "file_info.hpp"
#include "interval.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace eddy {

class piece_store;

/**
 * Lays out the files back to back, in the order they are listed in the metadata, and
 * returns their descriptors. Each file's name is the last component of its path.
 */
std::vector<file_descriptor> make_file_descriptors(const std::vector<file_info>& files);

/**
 * Owns the file instances of a store. Files are created once, when the list is
 * constructed, and destroyed once, when the list is destroyed (which should happen
 * when the store is torn down).
 */
class file_list
{
    std::shared_ptr<piece_store> store_;
    std::vector<std::shared_ptr<file>> files_;
    bool is_destroyed_ = false;

public:
    using const_iterator = std::vector<std::shared_ptr<file>>::const_iterator;

    /**
     * Descriptors must be ordered by offset and must not overlap, otherwise
     * std::invalid_argument is thrown, as is for files that don't fit in the store.
     */
    file_list(std::shared_ptr<piece_store> store, std::vector<file_descriptor> files,
            const stream_settings& settings = stream_settings());

    file_list(const file_list&) = delete;
    file_list& operator=(const file_list&) = delete;

    int size() const noexcept { return int(files_.size()); }
    bool empty() const noexcept { return files_.empty(); }

    const std::shared_ptr<file>& operator[](const file_index_t index) const noexcept
    {
        return files_[index];
    }

    const_iterator begin() const noexcept { return files_.begin(); }
    const_iterator end() const noexcept { return files_.end(); }

    /** Returns the file at path, or null if there is no such file. */
    std::shared_ptr<file> find(const std::filesystem::path& path) const;

    /**
     * Returns the range of file indices that cover part of piece. The range is left
     * inclusive, i.e. the files are in [interval.begin, interval.end). Empty files that
     * happen to fall in the range are included. The range is empty if no file has the
     * piece or the list has been destroyed.
     */
    interval files_containing_piece(const piece_index_t piece) const noexcept;

    /** Lets each file that has part of piece check whether it's done. */
    void on_piece_verified(const piece_index_t piece);

    /** The sum of all files' downloaded bytes. */
    int64_t downloaded() const;

    bool is_done() const noexcept;

    bool is_destroyed() const noexcept { return is_destroyed_; }

    /** Destroys each file, exactly once. */
    void destroy();

private:
    template <typename... Args>
    void log(const char* format, Args&&... args) const;
};

} // namespace eddy

#endif // EDDY_FILE_LIST_HEADER

#ifndef EDDY_FILE_HEADER
#define EDDY_FILE_HEADER

#include "file_stream.hpp"
#include "log.hpp"
#include "piece_range.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace asio { class io_context; }

namespace eddy {

class piece_store;

/** Where a file lies in the store, as listed in the metadata. */
struct file_descriptor
{
    std::string name;
    // Relative to the download's root, already sanitized.
    std::filesystem::path path;
    int64_t length = 0;
    // The offset of the file's first byte in the store, i.e. in all files conceptually
    // concatenated into one contiguous byte array.
    int64_t offset = 0;
};

/**
 * A single logical file: a contiguous byte range of the piece store.
 *
 * It answers which pieces back the file, how many of its bytes are downloaded and
 * verified, and provides byte streams over it that raise the acquisition priority of
 * the pieces they need for as long as they are open.
 *
 * A file is created for each file entry when the store is set up, and destroyed
 * exactly once when the store is torn down. After destroy() only the accessors may be
 * used; the owner must not select, deselect or stream the file anymore.
 *
 * NOTE: file must be stored in a shared_ptr, as the streams it creates refer back to
 * it through a weak_ptr.
 */
class file : public std::enable_shared_from_this<file>
{
    struct active
    {
        std::shared_ptr<piece_store> store;
    };

    struct destroyed
    {};

    std::variant<active, destroyed> state_;

    // This is the io_context of the store. It outlives every file and store, so it can
    // still be used to complete streams after the file is destroyed.
    asio::io_context& ios_;

    std::string name_;
    std::filesystem::path path_;
    int64_t length_;
    int64_t offset_;

    // The pieces covering the file, even if only partially. Invalid if the file is
    // empty.
    piece_range pieces_;

    stream_settings stream_settings_;

    bool is_done_ = false;
    std::vector<std::function<void()>> done_handlers_;

public:
    /**
     * Throws std::invalid_argument if store is null, if the offset or the length is
     * negative, or if the file would reach past the end of the store.
     *
     * An empty file is done right away.
     */
    file(std::shared_ptr<piece_store> store, file_descriptor descriptor,
            const stream_settings& settings = stream_settings());

    const std::string& name() const noexcept { return name_; }
    const std::filesystem::path& path() const noexcept { return path_; }
    int64_t length() const noexcept { return length_; }
    int64_t offset() const noexcept { return offset_; }

    const piece_range& pieces() const noexcept { return pieces_; }
    piece_index_t first_piece() const noexcept { return pieces_.first; }
    piece_index_t last_piece() const noexcept { return pieces_.last; }

    bool is_done() const noexcept { return is_done_; }
    bool is_destroyed() const noexcept;

    /**
     * Returns how many of the file's bytes are in verified pieces or have been received
     * for pieces still in progress. This is recomputed on each call from the store's
     * current state. It is 0 until the store has a bitfield and after the file is
     * destroyed, and it never exceeds length().
     */
    int64_t downloaded() const;

    /** Returns downloaded() / length() in the range [0, 1], or 0 for empty files. */
    double progress() const;

    /**
     * Registers a standing selection of the file's pieces with the store, which stays
     * in effect until deselect() is called, regardless of any streams. Neither has any
     * effect on empty files.
     */
    void select(const bool priority = false);
    void deselect();

    /**
     * Returns a stream over the bytes of the file selected by options.
     *
     * The pieces backing the stream are selected with high priority as long as the
     * stream is open, and released exactly once when it finishes, is closed or fails,
     * unless the file or the store was destroyed by then.
     *
     * An empty file yields a stream that finishes on the next turn of the io_context,
     * an invalid range a stream that fails with stream_errc::invalid_range, and a
     * destroyed file a stream that fails with stream_errc::file_destroyed. If only the
     * store is destroyed, the stream fails with stream_errc::store_destroyed.
     */
    std::shared_ptr<file_stream> create_read_stream(
            const stream_options& options = stream_options());

    /**
     * The handler is posted exactly once, as soon as the file is done, or right away if
     * it already is.
     */
    void async_wait_done(std::function<void()> handler);

    /**
     * Should be called when a piece of this file was verified, so that the file may
     * check whether it's done.
     */
    void update_done();

    /** Detaches the file from the store. */
    void destroy();

private:
    void mark_done();

    /** Releases a stream's selection, unless the file or the store is gone by now. */
    void release_stream_selection(const piece_range& pieces, const selection_id_t id);

    enum class log_event
    {
        selection,
        stream,
        progress,
        lifecycle
    };

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

} // namespace eddy

#endif // EDDY_FILE_HEADER

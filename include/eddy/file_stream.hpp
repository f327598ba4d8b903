#ifndef EDDY_FILE_STREAM_HEADER
#define EDDY_FILE_STREAM_HEADER

#include "error_code.hpp"
#include "log.hpp"
#include "piece_range.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace asio { class io_context; }

namespace eddy {

class piece_store;

enum class stream_state
{
    reading,
    finished,
    closed,
    failed
};

/** Selects the part of the file to stream. Both offsets are relative to the file. */
struct stream_options
{
    int64_t start = 0;
    // Inclusive. If it's `values::none` or past the end of the file, the stream runs
    // to the end of the file.
    int64_t end = values::none;
};

/**
 * A sequential byte stream over (a part of) a file, read from a piece_store.
 *
 * Reads are issued in the Asio fashion: there may be at most one outstanding
 * async_read_some at a time, and its handler is always invoked through the
 * io_context. A read never crosses a piece boundary. If the piece the stream is
 * positioned in is not yet verified, the read is parked until notify() is called,
 * which the store does each time a piece in the stream's range is verified.
 *
 * The stream ends in one of three terminal states:
 * - finished: all bytes were delivered (the stream ends as soon as the last byte is
 *   handed out), after which reads complete with asio::error::eof;
 * - closed: close() was called or the stream was dropped before that;
 * - failed: reading from the store failed.
 * Each handler registered with on_end is invoked exactly once, after the stream
 * reached its terminal state, with the error that ended it (which is empty if the
 * stream finished).
 *
 * NOTE: file_stream must be stored in a shared_ptr because in-flight store reads keep
 * it alive through shared_from_this.
 */
class file_stream : public std::enable_shared_from_this<file_stream>
{
public:
    using read_handler = std::function<void(const error_code&, std::vector<uint8_t>)>;
    using end_handler = std::function<void(const error_code&)>;

private:
    asio::io_context& ios_;

    // Null for streams that never touch a store (see make_empty and make_failed).
    std::shared_ptr<piece_store> store_;

    // The name of the file, only used for logging.
    std::string name_;

    // Absolute offsets into the store: the next byte to deliver, and one past the last.
    int64_t position_ = 0;
    int64_t end_ = 0;

    // The pieces covering [position_, end_) at construction.
    piece_range pieces_;

    stream_settings settings_;

    // The handler of the outstanding async_read_some, if any. It is either waiting
    // for its piece to be verified or for the store to complete the read.
    read_handler pending_read_;
    bool is_store_read_in_progress_ = false;

    std::vector<end_handler> end_handlers_;

    stream_state state_ = stream_state::reading;
    error_code error_;

    // A per-process serial number, used to tell apart streams in the logs.
    int id_;

public:
    /**
     * Creates a stream over the bytes [offset + options.start, offset + options.end] of
     * the store, where offset and length are those of the file. options must be
     * valid for the file (see is_range_valid).
     */
    file_stream(asio::io_context& ios, std::shared_ptr<piece_store> store,
            std::string name, const int64_t offset, const int64_t length,
            const stream_options& options, const stream_settings& settings);

    /**
     * If the stream hasn't ended, it is closed: a parked read and the end handlers are
     * posted with stream_errc::stream_closed.
     */
    ~file_stream();

    /**
     * Returns a stream over no bytes that finishes on the next turn of the io_context,
     * never during this call, so that the caller has a chance to register an on_end
     * handler.
     */
    static std::shared_ptr<file_stream> make_empty(asio::io_context& ios);

    /** Returns a stream that fails with error on the next turn of the io_context. */
    static std::shared_ptr<file_stream> make_failed(
            asio::io_context& ios, const error_code& error);

    /**
     * Tests whether options select a non-empty range of a file of the given length:
     * start must be within the file and must not be past end.
     */
    static bool is_range_valid(const stream_options& options, const int64_t length) noexcept;

    /** The inclusive range of pieces backing this stream. */
    const piece_range& pieces() const noexcept { return pieces_; }
    piece_index_t first_piece() const noexcept { return pieces_.first; }
    piece_index_t last_piece() const noexcept { return pieces_.last; }

    /** The number of bytes left to deliver. */
    int64_t bytes_left() const noexcept { return end_ - position_; }

    stream_state state() const noexcept { return state_; }
    bool is_ended() const noexcept { return state_ != stream_state::reading; }
    const error_code& error() const noexcept { return error_; }
    int id() const noexcept { return id_; }

    /**
     * Reads the next chunk of bytes, which is at most the rest of the current piece.
     * On success the handler receives a non-empty buffer; once everything was read it
     * receives asio::error::eof and the stream is finished.
     */
    void async_read_some(read_handler handler);

    /**
     * Registers an end-of-stream observer. If the stream has already ended, handler is
     * posted right away.
     */
    void on_end(end_handler handler);

    /**
     * Called when newly verified data may satisfy the parked read. A spurious call is
     * harmless.
     */
    void notify();

    /**
     * Ends the stream prematurely. A parked read is completed with
     * stream_errc::stream_closed. Calling this on an ended stream has no effect.
     */
    void close();

private:
    explicit file_stream(asio::io_context& ios);

    void try_read();
    void on_store_read(const error_code& error, std::vector<uint8_t> data);
    void deliver(read_handler handler, const error_code& error, std::vector<uint8_t> data);

    /** Transitions into a terminal state and invokes all end handlers. */
    void end(const stream_state s, const error_code& error);

    enum class log_event
    {
        read,
        wait,
        end
    };

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

} // namespace eddy

#endif // EDDY_FILE_STREAM_HEADER

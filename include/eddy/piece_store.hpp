#ifndef EDDY_PIECE_STORE_HEADER
#define EDDY_PIECE_STORE_HEADER

#include "block_info.hpp"
#include "error_code.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace asio { class io_context; }

namespace eddy {

/**
 * This is the piece-addressed content store (i.e. the torrent's payload) as seen by
 * file and file_stream. It exposes only what they need: the piece geometry, which
 * pieces are verified, how many bytes are missing from each unverified piece, the
 * piece selection registry and reads of verified data.
 *
 * The acquisition engine behind it (networking, verification, bookkeeping of missing
 * bytes) is free to change the piece state at any time between two calls, so nothing
 * here may be assumed to be a consistent snapshot.
 *
 * All methods must be called on the thread that runs the store's io_context.
 */
class piece_store
{
public:
    using ready_handler = std::function<void()>;
    using read_handler = std::function<void(const error_code&, std::vector<uint8_t>)>;

    virtual ~piece_store() = default;

    /** All handlers passed to or issued by the store are executed by this. */
    virtual asio::io_context& get_io_context() noexcept = 0;

    /** Every piece but the last is of this length. */
    virtual int piece_length() const noexcept = 0;
    virtual int num_pieces() const noexcept = 0;
    /** The total number of payload bytes. */
    virtual int64_t size() const noexcept = 0;

    /**
     * Returns false if the store has no verification state yet (e.g. the metadata
     * hasn't been received), in which case has_piece and missing_bytes must not be
     * called.
     */
    virtual bool has_bitfield() const noexcept = 0;
    virtual bool has_piece(const piece_index_t piece) const noexcept = 0;

    /**
     * Returns the number of bytes not yet received of an unverified piece. Note that
     * the last piece may be shorter than piece_length, so for that piece this counts
     * from its actual length.
     */
    virtual int missing_bytes(const piece_index_t piece) const noexcept = 0;

    /**
     * Registers interest in the inclusive range of pieces [first, last]. If priority
     * is set, the pieces are to be acquired before non-priority ones. If on_ready is
     * provided, it is invoked each time a piece in the range is verified, so that a
     * stream waiting for that data may be woken up.
     *
     * Overlapping selections are independent of each other: each is released on its
     * own by deselect.
     *
     * Returns the selection's id, which identifies it when releasing a streaming
     * selection.
     */
    virtual selection_id_t select(const piece_index_t first, const piece_index_t last,
            const bool priority, ready_handler on_ready = nullptr) = 0;

    /**
     * If is_streaming is false, releases the standing selections registered for exactly
     * [first, last] (those without a readiness handler). Selections registered by
     * streams are left intact.
     *
     * If is_streaming is true, only the single selection identified by selection is
     * released, leaving the priority of every other selection over the same pieces as
     * is. If selection is invalid_selection_id, the most recent streaming selection
     * over exactly [first, last] is released.
     */
    virtual void deselect(const piece_index_t first, const piece_index_t last,
            const bool is_streaming, const selection_id_t selection = invalid_selection_id)
            = 0;

    virtual bool is_destroyed() const noexcept = 0;

    /**
     * Reads the bytes described by block, which must lie in a verified piece. The
     * handler is always invoked asynchronously through the store's io_context.
     */
    virtual void async_read(const block_info& block, read_handler handler) = 0;
};

} // namespace eddy

#endif // EDDY_PIECE_STORE_HEADER

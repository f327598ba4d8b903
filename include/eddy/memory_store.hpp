#ifndef EDDY_MEMORY_STORE_HEADER
#define EDDY_MEMORY_STORE_HEADER

#include "bitfield.hpp"
#include "log.hpp"
#include "piece_store.hpp"
#include "selection_registry.hpp"
#include "settings.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace eddy {

/** The geometry of the payload, as described by the metadata. */
struct store_info
{
    int64_t size = 0;
    int piece_length = 0;
    // Either empty, in which case pieces are not hashed, or exactly one hash per piece.
    std::vector<sha1_hash> piece_hashes;
};

/**
 * A piece_store that keeps the entire payload in memory. Blocks are fed to it by
 * whatever acquires them (see write_block), and once all blocks of a piece arrive, the
 * piece is verified and becomes readable.
 *
 * This is not thread-safe: it must be used on the thread running its io_context.
 */
class memory_store : public piece_store
{
    struct piece_state
    {
        // The number of bytes not yet received. Zero once the piece is verified.
        int missing = 0;
        // Marks the blocks of the piece we have received, so that a block received
        // twice is not subtracted from missing twice.
        std::vector<bool> received_blocks;
    };

    asio::io_context& ios_;

    store_info info_;
    store_settings settings_;

    int num_pieces_;

    // The entire payload, allocated up front.
    std::vector<uint8_t> data_;

    // A piece's bit is only set once all its blocks are received and the piece passed
    // the hash test.
    bitfield verified_pieces_;
    std::vector<piece_state> pieces_;

    selection_registry selections_;

    // Invoked (through ios_) after a piece is verified and set in the bitfield.
    std::function<void(piece_index_t)> piece_verified_handler_;

    bool is_destroyed_ = false;

public:
    /**
     * Throws std::invalid_argument if the geometry is invalid: a negative size, a non
     * positive piece length or a number of piece hashes that doesn't match the number
     * of pieces.
     */
    memory_store(asio::io_context& ios, store_info info,
            const store_settings& settings = store_settings());

    asio::io_context& get_io_context() noexcept override { return ios_; }

    int piece_length() const noexcept override { return info_.piece_length; }
    /** Returns the actual length of the piece, which is shorter for the last piece. */
    int piece_length(const piece_index_t piece) const noexcept;
    int num_pieces() const noexcept override { return num_pieces_; }
    int64_t size() const noexcept override { return info_.size; }

    bool has_bitfield() const noexcept override { return true; }
    bool has_piece(const piece_index_t piece) const noexcept override;
    int missing_bytes(const piece_index_t piece) const noexcept override;
    const bitfield& pieces() const noexcept { return verified_pieces_; }

    selection_id_t select(const piece_index_t first, const piece_index_t last,
            const bool priority, ready_handler on_ready = nullptr) override;
    void deselect(const piece_index_t first, const piece_index_t last,
            const bool is_streaming,
            const selection_id_t selection = invalid_selection_id) override;

    const selection_registry& selections() const noexcept { return selections_; }
    piece_priority priority(const piece_index_t piece) const noexcept;

    bool is_destroyed() const noexcept override { return is_destroyed_; }

    void async_read(const block_info& block, read_handler handler) override;

    /**
     * Saves a block of a piece. Blocks must be aligned to block_info::default_length
     * and be of that length, except for the last block in a piece, which may be
     * shorter. When this completes the piece, the piece is verified and on success the
     * readiness handlers of all selections covering it are posted, followed by the
     * piece verified handler.
     *
     * error is set to store_errc::invalid_block if the block is malformed, and to
     * store_errc::piece_hash_mismatch if this completed the piece but it failed
     * verification, in which case the piece's data is dropped.
     */
    void write_block(const block_info& block, const std::vector<uint8_t>& data,
            error_code& error);

    void set_piece_verified_handler(std::function<void(piece_index_t)> handler)
    {
        piece_verified_handler_ = std::move(handler);
    }

    /**
     * Drops all selections and marks the store destroyed. Any subsequent select throws,
     * deselect is a no-op and reads fail with store_errc::store_destroyed.
     */
    void destroy();

private:
    bool is_block_valid(const block_info& block) const noexcept;
    int num_blocks(const piece_index_t piece) const noexcept;
    bool verify_piece(const piece_index_t piece) const;
    void on_piece_verified(const piece_index_t piece);
    void reset_piece(const piece_index_t piece);

    enum class log_event
    {
        selection,
        piece,
        read
    };

    template <typename... Args>
    void log(const log_event event, const char* format, Args&&... args) const;
    template <typename... Args>
    void log(const log_event event, const log::priority priority, const char* format,
            Args&&... args) const;
};

} // namespace eddy

#endif // EDDY_MEMORY_STORE_HEADER

#include "memory_store.hpp"
#include "sha1_hasher.hpp"
#include "store_error.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <stdexcept>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

namespace eddy {

memory_store::memory_store(
        asio::io_context& ios, store_info info, const store_settings& settings)
    : ios_(ios)
    , info_(std::move(info))
    , settings_(settings)
{
    if(info_.size < 0) {
        throw std::invalid_argument("store size must not be negative");
    }
    if(info_.piece_length <= 0) {
        throw std::invalid_argument("piece length must be positive");
    }
    num_pieces_ = (info_.size + info_.piece_length - 1) / info_.piece_length;
    if(!info_.piece_hashes.empty() && int(info_.piece_hashes.size()) != num_pieces_) {
        throw std::invalid_argument("number of piece hashes must match number of pieces");
    }
    data_.resize(info_.size);
    verified_pieces_ = bitfield(num_pieces_);
    pieces_.resize(num_pieces_);
    for(auto i = 0; i < num_pieces_; ++i) {
        pieces_[i].missing = piece_length(i);
        pieces_[i].received_blocks.resize(num_blocks(i));
    }
}

int memory_store::piece_length(const piece_index_t piece) const noexcept
{
    if(piece == num_pieces_ - 1) {
        const int64_t last = info_.size - int64_t(piece) * info_.piece_length;
        return int(last);
    }
    return info_.piece_length;
}

bool memory_store::has_piece(const piece_index_t piece) const noexcept
{
    return verified_pieces_[piece];
}

int memory_store::missing_bytes(const piece_index_t piece) const noexcept
{
    return pieces_[piece].missing;
}

selection_id_t memory_store::select(const piece_index_t first, const piece_index_t last,
        const bool priority, ready_handler on_ready)
{
    if(is_destroyed_) {
        throw std::system_error(make_error_code(store_errc::store_destroyed));
    }
    if((first < 0) || (last < first) || (last >= num_pieces_)) {
        throw std::system_error(make_error_code(store_errc::invalid_selection),
                util::format("[%i, %i]", first, last));
    }
    const bool is_streaming = on_ready != nullptr;
    const auto id = selections_.add(interval(first, last + 1), priority, std::move(on_ready));
    log(log_event::selection, "selected #%lli [%i, %i] (%s%s)", (long long)id, first,
            last, priority ? "high" : "normal", is_streaming ? ", streaming" : "");
    return id;
}

void memory_store::deselect(const piece_index_t first, const piece_index_t last,
        const bool is_streaming, const selection_id_t selection)
{
    if(is_destroyed_) {
        log(log_event::selection, "store destroyed, ignoring deselect [%i, %i]", first,
                last);
        return;
    }
    const interval pieces(first, last + 1);
    if(!is_streaming) {
        const int n = selections_.remove_standing(pieces);
        log(log_event::selection, "deselected %i standing selection(s) [%i, %i]", n,
                first, last);
        return;
    }
    const bool removed = selection == invalid_selection_id
            ? selections_.remove_latest_streaming(pieces)
            : selections_.remove(selection);
    if(removed) {
        log(log_event::selection, "deselected streaming #%lli [%i, %i]",
                (long long)selection, first, last);
    } else {
        log(log_event::selection, log::priority::high,
                "no streaming selection #%lli [%i, %i] to deselect",
                (long long)selection, first, last);
    }
}

piece_priority memory_store::priority(const piece_index_t piece) const noexcept
{
    return selections_.priority(piece);
}

void memory_store::async_read(const block_info& block, read_handler handler)
{
    error_code error;
    std::vector<uint8_t> data;
    if(is_destroyed_) {
        error = make_error_code(store_errc::store_destroyed);
    } else if((block.index < 0) || (block.index >= num_pieces_) || (block.offset < 0)
            || (block.length < 0)
            || (block.offset + block.length > piece_length(block.index))) {
        error = make_error_code(store_errc::invalid_block);
    } else if(!has_piece(block.index)) {
        error = make_error_code(store_errc::piece_not_available);
    } else {
        const auto begin = data_.begin() + int64_t(block.index) * info_.piece_length
                + block.offset;
        data.assign(begin, begin + block.length);
    }
    if(error) {
        log(log_event::read, log::priority::high, "couldn't read block(%i, %i, %i): %s",
                block.index, block.offset, block.length, error.message().c_str());
    }
    asio::post(ios_, [handler = std::move(handler), error, data = std::move(data)]() mutable {
        handler(error, std::move(data));
    });
}

void memory_store::write_block(
        const block_info& block, const std::vector<uint8_t>& data, error_code& error)
{
    error.clear();
    if(is_destroyed_) {
        error = make_error_code(store_errc::store_destroyed);
        return;
    }
    if(!is_block_valid(block) || (int(data.size()) != block.length)) {
        error = make_error_code(store_errc::invalid_block);
        return;
    }

    // late or duplicate blocks of a piece we already have are simply dropped
    if(has_piece(block.index)) {
        return;
    }
    piece_state& piece = pieces_[block.index];
    const auto block_index = block.offset / block_info::default_length;
    if(piece.received_blocks[block_index]) {
        return;
    }

    std::copy(data.begin(), data.end(),
            data_.begin() + int64_t(block.index) * info_.piece_length + block.offset);
    piece.received_blocks[block_index] = true;
    piece.missing -= block.length;
    if(piece.missing > 0) {
        return;
    }

    if(verify_piece(block.index)) {
        on_piece_verified(block.index);
    } else {
        log(log_event::piece, log::priority::high, "piece %i failed hash test",
                block.index);
        reset_piece(block.index);
        error = make_error_code(store_errc::piece_hash_mismatch);
    }
}

void memory_store::destroy()
{
    if(is_destroyed_) {
        return;
    }
    log(log_event::selection, "destroying store, dropping %i selection(s)",
            selections_.size());
    is_destroyed_ = true;
    selections_.clear();
    piece_verified_handler_ = nullptr;
}

bool memory_store::is_block_valid(const block_info& block) const noexcept
{
    if((block.index < 0) || (block.index >= num_pieces_)) {
        return false;
    }
    const int length = piece_length(block.index);
    if((block.offset < 0) || (block.offset >= length)
            || (block.offset % block_info::default_length != 0)) {
        return false;
    }
    return block.length == std::min(int(block_info::default_length), length - block.offset);
}

int memory_store::num_blocks(const piece_index_t piece) const noexcept
{
    return (piece_length(piece) + block_info::default_length - 1)
            / block_info::default_length;
}

bool memory_store::verify_piece(const piece_index_t piece) const
{
    if(info_.piece_hashes.empty() || !settings_.verify_piece_hashes) {
        return true;
    }
    sha1_hasher hasher;
    hasher.update(data_.data() + int64_t(piece) * info_.piece_length, piece_length(piece));
    return hasher.finish() == info_.piece_hashes[piece];
}

void memory_store::on_piece_verified(const piece_index_t piece)
{
    verified_pieces_.set(piece);
    pieces_[piece].missing = 0;
    log(log_event::piece, "piece %i verified (%i/%i)", piece,
            int(verified_pieces_.count()), num_pieces_);

    // wake up the streams that may be waiting for this piece
    for(auto& handler : selections_.ready_handlers(piece)) {
        asio::post(ios_, std::move(handler));
    }
    if(piece_verified_handler_) {
        asio::post(ios_, [handler = piece_verified_handler_, piece] { handler(piece); });
    }
}

void memory_store::reset_piece(const piece_index_t piece)
{
    piece_state& state = pieces_[piece];
    state.missing = piece_length(piece);
    std::fill(state.received_blocks.begin(), state.received_blocks.end(), false);
}

template <typename... Args>
void memory_store::log(const log_event event, const char* format, Args&&... args) const
{
    log(event, log::priority::normal, format, std::forward<Args>(args)...);
}

template <typename... Args>
void memory_store::log(const log_event event, const log::priority priority,
        const char* format, Args&&... args) const
{
#ifdef EDDY_ENABLE_LOGGING
    const auto header = [event]() -> std::string {
        switch(event) {
        case log_event::selection: return "SELECTION";
        case log_event::piece: return "PIECE";
        case log_event::read: return "READ";
        default: return "";
        }
    }();
    log::log_store(header, util::format(format, std::forward<Args>(args)...), priority);
#endif // EDDY_ENABLE_LOGGING
}

} // namespace eddy

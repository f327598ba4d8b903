#ifndef EDDY_PIECE_RANGE_HEADER
#define EDDY_PIECE_RANGE_HEADER

#include "interval.hpp"
#include "types.hpp"

#include <cstdint>

namespace eddy {

/**
 * The pieces that back a contiguous byte range of the store, even if only partially.
 * Unlike interval, both ends are inclusive, since this is how selections are
 * expressed to the store.
 */
struct piece_range
{
    piece_index_t first = invalid_piece_index;
    piece_index_t last = invalid_piece_index;

    piece_range() = default;
    piece_range(piece_index_t first_, piece_index_t last_) : first(first_), last(last_) {}

    int num_pieces() const noexcept { return last - first + 1; }

    bool contains(const piece_index_t piece) const noexcept
    {
        return (piece >= first) && (piece <= last);
    }

    /** Returns the same range as a half-open interval: [first, last + 1). */
    interval to_interval() const noexcept { return interval(first, last + 1); }
};

inline bool operator==(const piece_range& a, const piece_range& b) noexcept
{
    return (a.first == b.first) && (a.last == b.last);
}

inline bool operator!=(const piece_range& a, const piece_range& b) noexcept
{
    return !(a == b);
}

/**
 * Maps the byte range [offset, offset + length) onto the inclusive range of piece
 * indices that cover it. The first and last pieces may be shared with the adjacent
 * byte ranges.
 *
 * The result is meaningless for a zero length range, which callers must handle
 * themselves.
 */
inline piece_range map_to_pieces(
        const int64_t offset, const int64_t length, const int piece_length) noexcept
{
    return piece_range(piece_index_t(offset / piece_length),
            piece_index_t((offset + length - 1) / piece_length));
}

} // namespace eddy

#endif // EDDY_PIECE_RANGE_HEADER

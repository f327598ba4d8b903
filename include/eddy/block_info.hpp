#ifndef EDDY_BLOCK_INFO_HEADER
#define EDDY_BLOCK_INFO_HEADER

#include "types.hpp"

#include <functional>

namespace eddy {

/** Identifies a contiguous run of bytes within a single piece. */
struct block_info
{
    enum
    {
        default_length = 0x4000
    };

    piece_index_t index;
    int offset;
    int length;

    block_info() = default;
    block_info(piece_index_t piece_, int offset_, int length_)
        : index(piece_), offset(offset_), length(length_)
    {}
};

static const block_info invalid_block(-1, -1, -1);

inline bool operator==(const block_info& a, const block_info& b) noexcept
{
    return a.index == b.index && a.offset == b.offset && a.length == b.length;
}

inline bool operator!=(const block_info& a, const block_info& b) noexcept
{
    return !(a == b);
}

} // namespace eddy

#endif // EDDY_BLOCK_INFO_HEADER

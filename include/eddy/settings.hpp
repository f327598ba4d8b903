#ifndef EDDY_SETTINGS_HEADER
#define EDDY_SETTINGS_HEADER

namespace eddy {
namespace values {

// Leaves the choice of the value to the implementation.
constexpr int none = -2;

} // values

/** Settings pertaining to the byte streams created over a file. */
struct stream_settings
{
    // The upper bound on the number of bytes a single async_read_some completes
    // with. A read never crosses a piece boundary, so if this is `values::none`, it
    // is the remainder of the piece the stream is positioned in.
    int max_read_size = values::none;
};

/** Settings pertaining to the reference in-memory store. */
struct store_settings
{
    // If piece hashes are supplied, each piece is SHA-1 hashed when its last block
    // arrives and only set in the bitfield if it matches. Turning this off marks
    // complete pieces verified as is, which is only sensible when the data is known
    // to be correct (e.g. when seeding from memory).
    bool verify_piece_hashes = true;
};

} // namespace eddy

#endif // EDDY_SETTINGS_HEADER

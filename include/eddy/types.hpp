#ifndef EDDY_TYPES_HEADER
#define EDDY_TYPES_HEADER

#include <array>
#include <cstdint>

namespace eddy {

// File index can be used to retrieve files from file_list. This is to avoid referring
// to the files directly when only their position in the metadata is known.
using file_index_t = int;
using piece_index_t = int32_t;

static constexpr piece_index_t invalid_piece_index = -1;

// Every selection registered with a store is given a unique id, which acts as the
// registration token that is consumed when the selection is released.
using selection_id_t = int64_t;

static constexpr selection_id_t invalid_selection_id = -1;

using sha1_hash = std::array<uint8_t, 20>;

} // namespace eddy

#endif // EDDY_TYPES_HEADER

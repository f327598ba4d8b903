#include "store_error.hpp"

namespace eddy {

std::string store_error_category::message(int ev) const
{
    switch(static_cast<store_errc>(ev)) {
    case store_errc::unknown: return "Unknown";
    case store_errc::invalid_selection: return "Invalid piece selection";
    case store_errc::invalid_block: return "Invalid block information";
    case store_errc::piece_hash_mismatch: return "Piece failed hash verification";
    case store_errc::piece_not_available: return "Piece not available";
    case store_errc::store_destroyed: return "Store destroyed";
    default: return "Unknown";
    }
}

const store_error_category& store_category()
{
    static store_error_category instance;
    return instance;
}

std::error_code make_error_code(store_errc e)
{
    return std::error_code(static_cast<int>(e), store_category());
}

std::error_condition make_error_condition(store_errc e)
{
    return std::error_condition(static_cast<int>(e), store_category());
}

} // namespace eddy

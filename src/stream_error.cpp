#include "stream_error.hpp"

namespace eddy {

std::string stream_error_category::message(int ev) const
{
    switch(static_cast<stream_errc>(ev)) {
    case stream_errc::unknown: return "Unknown";
    case stream_errc::invalid_range: return "Invalid stream range";
    case stream_errc::stream_closed: return "Stream closed";
    case stream_errc::file_destroyed: return "File destroyed";
    case stream_errc::read_in_progress: return "A read is already in progress";
    case stream_errc::store_destroyed: return "Store destroyed";
    default: return "Unknown";
    }
}

const stream_error_category& stream_category()
{
    static stream_error_category instance;
    return instance;
}

std::error_code make_error_code(stream_errc e)
{
    return std::error_code(static_cast<int>(e), stream_category());
}

std::error_condition make_error_condition(stream_errc e)
{
    return std::error_condition(static_cast<int>(e), stream_category());
}

} // namespace eddy

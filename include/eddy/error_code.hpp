#ifndef EDDY_ERROR_CODE_HEADER
#define EDDY_ERROR_CODE_HEADER

#include <system_error>

namespace eddy {

// Asio reports its own errors (e.g. asio::error::eof) as std::error_code when built
// standalone, so these aliases let us mix the two freely.
using std::errc;
using std::error_category;
using std::error_code;
using std::error_condition;
using std::make_error_code;
using std::system_error;

} // namespace eddy

#endif // EDDY_ERROR_CODE_HEADER

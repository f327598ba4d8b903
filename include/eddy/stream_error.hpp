#ifndef EDDY_STREAM_ERROR_HEADER
#define EDDY_STREAM_ERROR_HEADER

#include <string>
#include <system_error>

namespace eddy {

enum class stream_errc
{
    unknown = 1,
    // The requested start or end offset does not lie within the file, or start is
    // past end.
    invalid_range,
    // The stream was closed before all of its bytes were delivered. A read that was
    // waiting for data is completed with this error.
    stream_closed,
    // The stream was requested from a file that has already been destroyed.
    file_destroyed,
    // async_read_some was called while another read was outstanding.
    read_in_progress,
    store_destroyed
};

struct stream_error_category : public std::error_category
{
    const char* name() const noexcept override { return "stream"; }
    std::string message(int ev) const override;
};

const stream_error_category& stream_category();
std::error_code make_error_code(stream_errc e);
std::error_condition make_error_condition(stream_errc e);

} // namespace eddy

namespace std {
template <>
struct is_error_code_enum<eddy::stream_errc> : public true_type
{};
} // namespace std

#endif // EDDY_STREAM_ERROR_HEADER

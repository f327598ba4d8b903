#ifndef EDDY_STORE_ERROR_HEADER
#define EDDY_STORE_ERROR_HEADER

#include <string>
#include <system_error>

namespace eddy {

enum class store_errc
{
    unknown = 1,
    // A selection whose first piece is negative, whose last piece is before its
    // first, or that reaches past the last piece.
    invalid_selection,
    // A block that is not aligned to block_info::default_length, or whose length
    // does not match the expected length at that offset.
    invalid_block,
    // All blocks of the piece were received but its SHA-1 digest did not match. The
    // piece's data is dropped and must be downloaded again.
    piece_hash_mismatch,
    // A read was issued for a piece that has not yet been verified.
    piece_not_available,
    store_destroyed
};

struct store_error_category : public std::error_category
{
    const char* name() const noexcept override { return "store"; }
    std::string message(int ev) const override;
};

const store_error_category& store_category();
std::error_code make_error_code(store_errc e);
std::error_condition make_error_condition(store_errc e);

} // namespace eddy

namespace std {
template <>
struct is_error_code_enum<eddy::store_errc> : public true_type
{};
} // namespace std

#endif // EDDY_STORE_ERROR_HEADER

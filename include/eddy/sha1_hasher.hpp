#ifndef EDDY_SHA1_HASHER_HEADER
#define EDDY_SHA1_HASHER_HEADER

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

#include <openssl/sha.h>

namespace eddy {

/**
 * Verifies pieces using the SHA-1 hashing algorithm. A piece may be fed to the hasher
 * in several blocks using update(), after which finish() returns the digest.
 */
class sha1_hasher
{
    SHA_CTX context_;

public:
    sha1_hasher();

    void reset();

    sha1_hasher& update(const uint8_t* data, const size_t length);
    template <typename Container,
            typename = decltype(std::declval<Container>().data())>
    sha1_hasher& update(const Container& buffer)
    {
        return update(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
    }

    sha1_hash finish();
};

/** A convenience function for when all the data is available at once. */
template <typename Buffer>
sha1_hash create_sha1_digest(const Buffer& buffer)
{
    sha1_hasher hasher;
    hasher.update(buffer);
    return hasher.finish();
}

} // namespace eddy

#endif // EDDY_SHA1_HASHER_HEADER

#include "sha1_hasher.hpp"

namespace eddy {

sha1_hasher::sha1_hasher()
{
    reset();
}

void sha1_hasher::reset()
{
    SHA1_Init(&context_);
}

sha1_hasher& sha1_hasher::update(const uint8_t* data, const size_t length)
{
    SHA1_Update(&context_, data, length);
    return *this;
}

sha1_hash sha1_hasher::finish()
{
    sha1_hash digest;
    SHA1_Final(digest.data(), &context_);
    return digest;
}

} // namespace eddy

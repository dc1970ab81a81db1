#include "crypto_utils.h"

#if defined(__APPLE__)
#include <CommonCrypto/CommonDigest.h>
#else
#include <openssl/md5.h>
#endif

namespace mcuuid::utils::crypto {

MD5Digest md5(std::string_view data) {
    // Digest the data.
    MD5Digest hash{};
#if defined(__APPLE__)
    static_assert(std::size(MD5Digest{}) == CC_MD5_DIGEST_LENGTH);
    ::CC_MD5(data.data(), static_cast<CC_LONG>(data.size()), hash.data());
#else
    static_assert(std::size(MD5Digest{}) == MD5_DIGEST_LENGTH);
    ::MD5(reinterpret_cast<const unsigned char *>(data.data()), data.size(), hash.data());
#endif
    return hash;
}

}  // namespace mcuuid::utils::crypto

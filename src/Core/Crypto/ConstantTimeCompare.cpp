/**
 * @file ConstantTimeCompare.cpp
 * @brief Constant-time comparison for MAC verification
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Gsa::Crypto {

/**
 * @brief Constant-time comparison of byte arrays
 *
 * Delegates to OpenSSL's CRYPTO_memcmp, which always inspects every byte.
 * Different sizes return immediately; MAC sizes are public.
 *
 * @param a First buffer
 * @param b Second buffer
 * @return true if contents are identical, false otherwise
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    if (a.empty()) {
        return true;
    }

    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace Gsa::Crypto

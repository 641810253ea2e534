/**
 * @file SecureZero.cpp
 * @brief Secure memory zeroing with compiler barrier protection
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Wipes signing passwords held as HMAC keys once they are no longer needed,
 * in a way Dead Store Elimination cannot remove.
 */

#include <Gsa/Core/Crypto.hpp>
#include <openssl/crypto.h>

namespace Gsa::Crypto {

/**
 * @brief Securely zero memory
 *
 * @param data Pointer to memory region to zero
 * @param size Number of bytes to zero
 *
 * @note If size is 0, this is a no-op
 */
void secureZero(void* data, size_t size) noexcept {
    if (data == nullptr || size == 0) {
        return;
    }

    // OPENSSL_cleanse is guaranteed not to be optimized away
    OPENSSL_cleanse(data, size);
}

} // namespace Gsa::Crypto

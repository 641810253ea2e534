/**
 * @file CryptoUtils.cpp
 * @brief Cryptographic utility functions
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Hex encoding of digests.
 */

#include <Gsa/Core/Crypto.hpp>

namespace Gsa::Crypto {

// ============================================================================
// Hex Encoding
// ============================================================================

std::string toHex(ByteSpan data) {
    static constexpr char hexChars[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(data.size() * 2);

    for (Byte b : data) {
        hex += hexChars[b >> 4];
        hex += hexChars[b & 0x0f];
    }

    return hex;
}

} // namespace Gsa::Crypto

/**
 * @file Crypto.hpp
 * @brief Cryptographic utilities for GsaConf
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * This module provides the primitives the configuration signer needs:
 * - HMAC-SHA1 computation
 * - Hex encoding
 * - Constant-time comparison
 * - Secure zeroing of key material
 */

#pragma once

#ifndef GSA_CORE_CRYPTO_HPP
#define GSA_CORE_CRYPTO_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <memory>
#include <string>

namespace Gsa::Crypto {

// ============================================================================
// HMAC
// ============================================================================

/**
 * @brief HMAC-SHA1, the keyed digest appliance signatures are built on
 *
 * The key is copied on construction and wiped when the object is destroyed.
 *
 * @example
 * ```cpp
 * HMAC hmac(asBytes(password));
 * auto mac = hmac.computeHex(asBytes(canonicalXml));
 * ```
 */
class HMAC {
public:
    /// Digest size in bytes
    static constexpr size_t DIGEST_SIZE = 20;

    explicit HMAC(ByteSpan key);

    ~HMAC();

    HMAC(const HMAC&) = delete;
    HMAC& operator=(const HMAC&) = delete;

    /**
     * @brief Compute HMAC of data (one-shot)
     * @param data Data to authenticate
     * @return HMAC bytes, or ErrorCode::InvalidKey for an oversized key
     */
    Result<ByteBuffer> compute(ByteSpan data);

    /**
     * @brief Compute HMAC of data as a lowercase hex string
     */
    Result<std::string> computeHex(ByteSpan data);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex string
 */
std::string toHex(ByteSpan data);

/**
 * @brief Constant-time comparison of byte arrays
 *
 * Length comparison is not constant-time; lengths of MACs are public.
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

/**
 * @brief Securely zero memory
 * @param data Memory to zero
 * @param size Size in bytes
 */
void secureZero(void* data, size_t size) noexcept;

} // namespace Gsa::Crypto

#endif // GSA_CORE_CRYPTO_HPP

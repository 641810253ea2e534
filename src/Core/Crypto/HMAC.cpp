/**
 * @file HMAC.cpp
 * @brief HMAC (Hash-based Message Authentication Code) implementation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * Keyed digests for appliance configuration signatures.
 */

#include <Gsa/Core/Crypto.hpp>
#include <openssl/hmac.h>
#include <openssl/evp.h>

namespace Gsa::Crypto {

// ============================================================================
// HMAC::Impl - Implementation details
// ============================================================================

class HMAC::Impl {
public:
    explicit Impl(ByteSpan key)
        : m_key(key.begin(), key.end()) {}

    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }

    Result<ByteBuffer> compute(ByteSpan data) {
        // Keys longer than the block size are hashed by HMAC itself;
        // anything beyond this is a caller bug.
        constexpr size_t MAX_REASONABLE_KEY_SIZE = 2048;
        if (m_key.size() > MAX_REASONABLE_KEY_SIZE) {
            return ErrorCode::InvalidKey;
        }

        unsigned int len = 0;
        ByteBuffer result(EVP_MAX_MD_SIZE);

        // An empty key is legal HMAC; OpenSSL wants a non-null pointer for it
        static const Byte emptyKey = 0;
        const Byte* keyData = m_key.empty() ? &emptyKey : m_key.data();

        unsigned char* hmac_result = ::HMAC(
            EVP_sha1(),
            keyData,
            static_cast<int>(m_key.size()),
            data.data(),
            data.size(),
            result.data(),
            &len
        );

        if (hmac_result == nullptr) {
            return ErrorCode::CryptoError;
        }

        result.resize(len);
        return result;
    }

private:
    ByteBuffer m_key;
};

// ============================================================================
// HMAC - Public API
// ============================================================================

HMAC::HMAC(ByteSpan key)
    : m_impl(std::make_unique<Impl>(key)) {
}

HMAC::~HMAC() = default;

Result<ByteBuffer> HMAC::compute(ByteSpan data) {
    return m_impl->compute(data);
}

Result<std::string> HMAC::computeHex(ByteSpan data) {
    auto mac = m_impl->compute(data);
    if (mac.isFailure()) {
        return mac.error();
    }
    return toHex(mac.value());
}

} // namespace Gsa::Crypto

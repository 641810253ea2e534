/**
 * @file SignatureEngine.cpp
 * @brief HMAC-SHA1 configuration signature implementation
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 */

#include <Gsa/Core/SignatureEngine.hpp>
#include <Gsa/Core/CanonicalView.hpp>
#include <Gsa/Core/Crypto.hpp>
#include <Gsa/Core/Logger.hpp>
#include <Gsa/Core/XmlDocument.hpp>

namespace Gsa::Appliance {

// ============================================================================
// SignatureEngine::Impl - Implementation details
// ============================================================================

class SignatureEngine::Impl {
public:
    explicit Impl(ByteSpan password)
        : m_key(password.begin(), password.end()) {}

    ~Impl() {
        // Secure erase key
        Crypto::secureZero(m_key.data(), m_key.size());
    }

    Result<std::string> computeSignature(ByteSpan document) {
        std::string canonical;
        GSA_TRY_ASSIGN(canonical, buildCanonicalView(document, m_key));

        Crypto::HMAC hmac(m_key);
        return hmac.computeHex(asBytes(canonical));
    }

    Result<std::string> sign(ByteSpan document) {
        std::string digest;
        GSA_TRY_ASSIGN(digest, computeSignature(document));

        auto loaded = Xml::Document::load(document);
        if (loaded.isFailure()) {
            return loaded.error();
        }
        Xml::Document doc = std::move(loaded).value();

        GSA_TRY(removeUamDir(doc));

        Xml::Node signature = nullptr;
        GSA_TRY_ASSIGN(signature, doc.findSingle(Element::SIGNATURE));
        GSA_TRY(Xml::setText(signature, digest));

        GSA_LOG_DEBUG_F("Document signed with %s", digest.c_str());

        Xml::SerializeOptions options;
        options.rootOnOwnLine = std::string(Element::ROOT);
        return doc.serialize(options);
    }

    Result<bool> verifySignature(ByteSpan document) {
        std::string digest;
        GSA_TRY_ASSIGN(digest, computeSignature(document));

        auto loaded = Xml::Document::load(document);
        if (loaded.isFailure()) {
            return loaded.error();
        }
        const Xml::Document doc = std::move(loaded).value();

        Xml::Node signature = nullptr;
        GSA_TRY_ASSIGN(signature, doc.findSingle(Element::SIGNATURE));

        std::string stored;
        GSA_TRY_ASSIGN(stored, Xml::firstChildText(signature));

        if (containsDigest(stored, digest)) {
            GSA_LOG_DEBUG("Signature matches");
            return true;
        }

        GSA_LOG_DEBUG_F("Signature does not match %s vs %s",
                        stored.c_str(), digest.c_str());
        return false;
    }

private:
    ByteBuffer m_key;

    /// Stored values may carry whitespace, so every window is a candidate
    static bool containsDigest(const std::string& stored, const std::string& digest) {
        if (stored.size() < digest.size()) {
            return false;
        }

        bool found = false;
        ByteSpan expected = asBytes(digest);
        for (size_t offset = 0; offset + digest.size() <= stored.size(); ++offset) {
            ByteSpan window = asBytes(std::string_view(stored).substr(offset, digest.size()));
            found |= Crypto::constantTimeCompare(window, expected);
        }
        return found;
    }
};

// ============================================================================
// SignatureEngine - Public API
// ============================================================================

SignatureEngine::SignatureEngine(ByteSpan password)
    : m_impl(std::make_unique<Impl>(password)) {}

SignatureEngine::~SignatureEngine() = default;

Result<std::string> SignatureEngine::computeSignature(ByteSpan document) {
    return m_impl->computeSignature(document);
}

Result<std::string> SignatureEngine::sign(ByteSpan document) {
    return m_impl->sign(document);
}

Result<bool> SignatureEngine::verifySignature(ByteSpan document) {
    return m_impl->verifySignature(document);
}

} // namespace Gsa::Appliance

/**
 * @file SignatureEngine.hpp
 * @brief HMAC-SHA1 signing and verification of appliance configurations
 * @author GsaConf Team
 * @version 1.0.0
 * @date 2026
 *
 * @copyright Copyright (c) 2026 GsaConf Project. All rights reserved.
 *
 * The signature is hex(HMAC-SHA1(password, canonical view)), stored as the
 * text of the document's single `<signature>` element. The appliance
 * tolerates whitespace around the stored value, so verification looks for
 * the digest anywhere in that text.
 */

#pragma once

#ifndef GSA_CORE_SIGNATURE_ENGINE_HPP
#define GSA_CORE_SIGNATURE_ENGINE_HPP

#include <Gsa/Core/Types.hpp>
#include <Gsa/Core/ErrorCodes.hpp>
#include <string>
#include <memory>

namespace Gsa::Appliance {

/**
 * @brief Signs and verifies configuration documents with one password
 *
 * The password is used as raw UTF-8 bytes with no trimming or
 * normalization. It is copied on construction and wiped on destruction.
 *
 * @example
 * ```cpp
 * SignatureEngine engine(asBytes(password));
 * auto signedXml = engine.sign(exportedXml);
 * auto valid = engine.verifySignature(signedXml.value());
 * ```
 */
class SignatureEngine {
public:
    explicit SignatureEngine(ByteSpan password);
    ~SignatureEngine();

    SignatureEngine(const SignatureEngine&) = delete;
    SignatureEngine& operator=(const SignatureEngine&) = delete;

    /**
     * @brief Compute the signature of a document
     * @return 40 lowercase hex characters, or a parse/structure error
     */
    Result<std::string> computeSignature(ByteSpan document);

    /**
     * @brief Embed the signature into a document
     *
     * Works on a fresh parse of the input: `<uam_dir>` is removed, the
     * `<signature>` text is replaced by the digest, and the whole tree is
     * serialized with the `<eef>` root on its own line.
     *
     * @return Signed document bytes; ErrorCode::ElementNotFound when there
     *         is no `<signature>`, ErrorCode::UnexpectedNodeType when its
     *         first child is not character data
     */
    Result<std::string> sign(ByteSpan document);

    /**
     * @brief Check the signature embedded in a document
     * @return true when the computed digest occurs in the `<signature>`
     *         text, false otherwise; errors only for unusable documents
     */
    Result<bool> verifySignature(ByteSpan document);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gsa::Appliance

#endif // GSA_CORE_SIGNATURE_ENGINE_HPP
